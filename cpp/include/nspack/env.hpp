#pragma once

#include <string>
#include <string_view>

namespace nspack::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

}  // namespace nspack::env
