#pragma once

#include <string>
#include <string_view>

namespace rbagate::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAcceptHeader = "Accept";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kJsonUtf8ContentType = "application/json; charset=utf-8";

} // namespace rbagate::http
