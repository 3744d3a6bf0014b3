#include "nspack/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace nspack::env {

namespace {

std::string Normalize(std::string value) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    const std::string key(name);
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

// Values that are neither truthy nor falsy yield default_value.
bool IsEnabled(std::string_view name, bool default_value) {
    const std::string value = Normalize(Get(name));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return default_value;
}

}  // namespace nspack::env
