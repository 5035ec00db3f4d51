// courier Umbrella Header
//
// Include this single header to pull in the public request execution API:
//   - AsyncNetwork and its continuation (OnRequestComplete)
//   - Transport interface and its results (AsyncTransport, TransportResponse, InputStream)
//   - Request, RetryPolicy, CacheEntry, NetworkResponse, RequestError
//   - Buffer pools and the ThreadPool executor
//
// Each re-exported header line is annotated with IWYU pragma: export so that symbols they provide are treated as
// satisfied for direct use in user code. Include the specific headers instead to minimize compile times.
//
// Usage Example:
//    #include <courier/courier.hpp>
//    using namespace courier;
//    int main() {
//      AsyncNetwork network(std::make_shared<MyTransport>());
//      network.setBlockingExecutor(std::make_shared<ThreadPool>());
//      network.performRequest(std::make_shared<Request>("https://example.com"),
//                             {[](NetworkResponse resp) { ... }, [](RequestError err) { ... }});
//    }
#pragma once

#include "courier/async-network.hpp"       // IWYU pragma: export
#include "courier/async-transport.hpp"     // IWYU pragma: export
#include "courier/byte-array-pool.hpp"     // IWYU pragma: export
#include "courier/byte-buffer.hpp"         // IWYU pragma: export
#include "courier/cache-entry.hpp"         // IWYU pragma: export
#include "courier/executor.hpp"            // IWYU pragma: export
#include "courier/http-header.hpp"         // IWYU pragma: export
#include "courier/http-status-code.hpp"    // IWYU pragma: export
#include "courier/input-stream.hpp"        // IWYU pragma: export
#include "courier/network-config.hpp"      // IWYU pragma: export
#include "courier/network-response.hpp"    // IWYU pragma: export
#include "courier/request-error.hpp"       // IWYU pragma: export
#include "courier/request.hpp"             // IWYU pragma: export
#include "courier/retry-policy.hpp"        // IWYU pragma: export
#include "courier/thread-pool.hpp"         // IWYU pragma: export
#include "courier/transport-response.hpp"  // IWYU pragma: export
