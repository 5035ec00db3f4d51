#include <courier/courier.hpp>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using namespace courier;

namespace {

class FileInputStream final : public InputStream {
 public:
  explicit FileInputStream(const std::filesystem::path& path) : _file(path, std::ios::binary) {
    if (!_file) {
      throw std::runtime_error("cannot open " + path.string());
    }
  }

  std::size_t read(std::span<std::byte> dst) override {
    _file.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(dst.size()));
    if (_file.bad()) {
      throw std::runtime_error("read error");
    }
    return static_cast<std::size_t>(_file.gcount());
  }

  void close() override { _file.close(); }

 private:
  std::ifstream _file;
};

// Serves 'file://' urls from the local filesystem, answering synchronously.
class FileTransport final : public AsyncTransport {
 public:
  void executeRequest(const std::shared_ptr<Request>& request, std::vector<http::Header>,
                      TransportCallback callback) override {
    static constexpr std::string_view kScheme = "file://";
    const std::string_view url = request->url();
    if (!url.starts_with(kScheme)) {
      callback(TransportFailure{TransportFailureKind::MalformedUrl, "only file:// urls are supported"});
      return;
    }
    const std::filesystem::path path(url.substr(kScheme.size()));
    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
      callback(TransportResponse(http::StatusCodeNotFound, {}, ToByteBuffer(ec.message())));
      return;
    }
    std::unique_ptr<InputStream> stream;
    try {
      stream = std::make_unique<FileInputStream>(path);
    } catch (const std::runtime_error& ex) {
      callback(TransportFailure{TransportFailureKind::Io, ex.what()});
      return;
    }
    callback(TransportResponse(http::StatusCodeOK, {{"Content-Length", std::to_string(fileSize)}}, std::move(stream),
                               static_cast<int64_t>(fileSize)));
  }
};

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " file://<path>\n";
    return 1;
  }

  // declared first: the network joins its executor thread before the promise is destroyed
  std::promise<int> done;

  AsyncNetwork network(std::make_shared<FileTransport>(), NetworkConfig{}.withLogAllRequests());
  network.setBlockingExecutor(std::make_shared<ThreadPool>(1));
  network.performRequest(std::make_shared<Request>(argv[1]),
                         {[&done](NetworkResponse response) {
                            std::cout << "Received " << response.data().size() << " bytes (status "
                                      << response.statusCode() << ")\n";
                            done.set_value(0);
                          },
                          [&done](RequestError error) {
                            std::cerr << "Request failed: " << error.what() << '\n';
                            done.set_value(1);
                          }});
  return done.get_future().get();
}
