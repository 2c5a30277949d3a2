#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace cloudbridge::networking {

using QueryParams = std::unordered_map<std::string, std::string>;

// Splits a request target ("/path?a=1&b=x%20y") into its path and decoded
// query parameters. Repeated keys keep the first value.
std::string_view target_path(std::string_view target) noexcept;
QueryParams parse_query(std::string_view target);

// application/x-www-form-urlencoded decoding: "+" is a space, "%XX" a byte.
// Malformed escapes are kept literally.
std::string url_decode(std::string_view s);

} // namespace cloudbridge::networking
