#include "common/media/mime_sniffer.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

struct Signature {
  std::size_t offset;
  std::string_view magic;
  std::string_view mime;
};

// RIFF....WEBP is checked separately because its magic is split.
constexpr std::array<Signature, 5> kSignatures{{
    {0, "\x89PNG\r\n\x1a\n", "image/png"},
    {0, "\xff\xd8\xff", "image/jpeg"},
    {0, "GIF87a", "image/gif"},
    {0, "GIF89a", "image/gif"},
    {0, "BM", "image/bmp"},
}};

bool matches(std::span<const std::uint8_t> data, std::size_t offset, std::string_view magic) {
  if (data.size() < offset + magic.size()) {
    return false;
  }
  for (std::size_t i = 0; i < magic.size(); ++i) {
    if (data[offset + i] != static_cast<std::uint8_t>(magic[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace

namespace ghostlink::media {

std::string sniff_mime(std::span<const std::uint8_t> data) {
  for (const auto& sig : kSignatures) {
    if (matches(data, sig.offset, sig.magic)) {
      return std::string(sig.mime);
    }
  }
  if (matches(data, 0, "RIFF") && matches(data, 8, "WEBP")) {
    return "image/webp";
  }
  return std::string(kDefaultMime);
}

std::string mime_from_extension(std::string_view path) {
  const auto dot = path.rfind('.');
  if (dot == std::string_view::npos) {
    return std::string(kDefaultMime);
  }
  std::string ext(path.substr(dot + 1));
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == "png") return "image/png";
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "gif") return "image/gif";
  if (ext == "bmp") return "image/bmp";
  if (ext == "webp") return "image/webp";
  return std::string(kDefaultMime);
}

}  // namespace ghostlink::media
