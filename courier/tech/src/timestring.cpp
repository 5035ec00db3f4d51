#include "courier/timestring.hpp"

#include <string>

#include "courier/timedef.hpp"

namespace courier {

std::string TimeToStringRFC7231(SysTimePoint tp) {
  std::string ret(kRFC7231DateStrLen, '\0');
  TimeToStringRFC7231(tp, ret.data());
  return ret;
}

}  // namespace courier
