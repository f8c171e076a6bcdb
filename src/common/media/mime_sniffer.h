#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ghostlink::media {

inline constexpr std::string_view kDefaultMime = "application/octet-stream";

// MIME type for a payload, judged from its leading magic bytes.
// Recognizes PNG, JPEG, GIF, BMP and WebP; everything else is kDefaultMime.
std::string sniff_mime(std::span<const std::uint8_t> data);

// MIME type for a file name by extension (case-insensitive), or kDefaultMime.
std::string mime_from_extension(std::string_view path);

}  // namespace ghostlink::media
