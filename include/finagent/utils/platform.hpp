#pragma once

#include <string>

namespace finagent::utils {

const char* package_version();

std::string user_agent();

}  // namespace finagent::utils
