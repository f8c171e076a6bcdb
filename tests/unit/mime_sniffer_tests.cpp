#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "common/media/mime_sniffer.h"

namespace ghostlink::tests {

TEST(MimeSnifferTests, RecognizesImageSignatures) {
  const std::vector<std::uint8_t> png{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 0, 0};
  const std::vector<std::uint8_t> jpeg{0xFF, 0xD8, 0xFF, 0xE0, 0, 0x10};
  const std::vector<std::uint8_t> gif{'G', 'I', 'F', '8', '9', 'a', 1, 0};
  const std::vector<std::uint8_t> bmp{'B', 'M', 0x36, 0, 0, 0};
  const std::vector<std::uint8_t> webp{'R', 'I', 'F', 'F', 0x24, 0, 0, 0, 'W', 'E', 'B', 'P', 'V'};

  EXPECT_EQ(media::sniff_mime(png), "image/png");
  EXPECT_EQ(media::sniff_mime(jpeg), "image/jpeg");
  EXPECT_EQ(media::sniff_mime(gif), "image/gif");
  EXPECT_EQ(media::sniff_mime(bmp), "image/bmp");
  EXPECT_EQ(media::sniff_mime(webp), "image/webp");
}

TEST(MimeSnifferTests, UnknownOrShortDataIsOctetStream) {
  EXPECT_EQ(media::sniff_mime({}), media::kDefaultMime);
  EXPECT_EQ(media::sniff_mime(std::vector<std::uint8_t>{0x89, 'P', 'N'}), media::kDefaultMime);
  EXPECT_EQ(media::sniff_mime(std::vector<std::uint8_t>{'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A',
                                                        'V', 'E'}),
            media::kDefaultMime);
}

TEST(MimeSnifferTests, ExtensionLookupIsCaseInsensitive) {
  EXPECT_EQ(media::mime_from_extension("photo.JPG"), "image/jpeg");
  EXPECT_EQ(media::mime_from_extension("/tmp/a.b/shot.png"), "image/png");
  EXPECT_EQ(media::mime_from_extension("anim.gif"), "image/gif");
  EXPECT_EQ(media::mime_from_extension("README"), media::kDefaultMime);
  EXPECT_EQ(media::mime_from_extension("notes.txt"), media::kDefaultMime);
}

}  // namespace ghostlink::tests
