#pragma once

#include <mapink/result.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mapink {

// RFC 4648 URL-safe alphabet, no padding
std::string base64UrlEncode(const uint8_t* data, size_t size);
std::string base64UrlEncode(const std::vector<uint8_t>& bytes);

// Accepts the URL-safe and the standard alphabet, with or without padding
Result<std::vector<uint8_t>> base64UrlDecode(std::string_view text);

} // namespace mapink
