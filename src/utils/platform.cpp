#include "finagent/utils/platform.hpp"

#include <sys/utsname.h>

namespace finagent::utils {

const char* package_version() {
#ifdef FINAGENT_VERSION
  return FINAGENT_VERSION;
#else
  return "0.0.0-dev";
#endif
}

std::string user_agent() {
  static const std::string agent = [] {
    std::string value = std::string("finagent/") + package_version();
    struct utsname info {};
    if (::uname(&info) == 0) {
      value += std::string(" (") + info.sysname + " " + info.release + "; " + info.machine + ")";
    }
    return value;
  }();
  return agent;
}

}  // namespace finagent::utils
