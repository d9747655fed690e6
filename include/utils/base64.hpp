#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

/// Standard alphabet (RFC 4648) with '=' padding.
[[nodiscard]] std::string base64_encode(std::span<const uint8_t> data);

/// Returns false on characters outside the alphabet or a bad length.
[[nodiscard]] bool base64_decode(std::string_view text, std::vector<uint8_t>& out);

} // namespace utils
