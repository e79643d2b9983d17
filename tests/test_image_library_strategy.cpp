#include <cstdio>
#include <filesystem>
#include <jpeglib.h>
#include <png.h>
#include <string>
#include <vector>
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>

#include "gtest/gtest.h"
#include "test_support.hpp"
#include "../libmetawipe/include/image_library_strategy.hpp"
#include "../libmetawipe/include/logger.hpp"

namespace metawipe {
namespace {

namespace fs = std::filesystem;
using test::TempDir;
using test::list_dir;
using test::read_file;
using test::write_file;

constexpr int kWidth = 24;
constexpr int kHeight = 16;

// 24x16 RGB PNG carrying an Author tEXt chunk.
void write_tagged_png(const fs::path& path) {
    FILE* fp = std::fopen(path.c_str(), "wb");
    ASSERT_NE(fp, nullptr);
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    png_init_io(png, fp);
    png_set_IHDR(png, info, kWidth, kHeight, 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    char key[] = "Author";
    char value[] = "Jane Doe";
    png_text text{};
    text.compression = PNG_TEXT_COMPRESSION_NONE;
    text.key = key;
    text.text = value;
    png_set_text(png, info, &text, 1);

    png_write_info(png, info);
    std::vector<unsigned char> row(kWidth * 3);
    for (int y = 0; y < kHeight; ++y) {
        for (int x = 0; x < kWidth * 3; ++x) row[x] = static_cast<unsigned char>((x + y) * 5);
        png_write_row(png, row.data());
    }
    png_write_end(png, info);
    png_destroy_write_struct(&png, &info);
    std::fclose(fp);
}

// 24x16 grayscale JPEG with an EXIF-style APP1 segment and a comment.
void write_tagged_jpeg(const fs::path& path) {
    FILE* fp = std::fopen(path.c_str(), "wb");
    ASSERT_NE(fp, nullptr);
    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, fp);
    cinfo.image_width = kWidth;
    cinfo.image_height = kHeight;
    cinfo.input_components = 1;
    cinfo.in_color_space = JCS_GRAYSCALE;
    jpeg_set_defaults(&cinfo);
    jpeg_start_compress(&cinfo, TRUE);

    const std::string exif = std::string("Exif\0\0", 6) + "SerialNumber Jane Doe";
    jpeg_write_marker(&cinfo, JPEG_APP0 + 1, reinterpret_cast<const JOCTET*>(exif.data()),
                      static_cast<unsigned int>(exif.size()));
    const std::string comment = "Shot by Jane Doe";
    jpeg_write_marker(&cinfo, JPEG_COM, reinterpret_cast<const JOCTET*>(comment.data()),
                      static_cast<unsigned int>(comment.size()));

    std::vector<JSAMPLE> row(kWidth);
    while (cinfo.next_scanline < cinfo.image_height) {
        for (int x = 0; x < kWidth; ++x) row[x] = static_cast<JSAMPLE>(x * 10 + cinfo.next_scanline);
        JSAMPROW rows[] = {row.data()};
        jpeg_write_scanlines(&cinfo, rows, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    std::fclose(fp);
}

std::pair<unsigned, unsigned> jpeg_dimensions(const fs::path& path) {
    FILE* fp = std::fopen(path.c_str(), "rb");
    jpeg_decompress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, fp);
    jpeg_read_header(&cinfo, TRUE);
    const std::pair<unsigned, unsigned> dims{cinfo.image_width, cinfo.image_height};
    jpeg_destroy_decompress(&cinfo);
    std::fclose(fp);
    return dims;
}

// 24x16 lossy WebP carrying EXIF and XMP chunks.
void write_tagged_webp(const fs::path& path) {
    std::vector<uint8_t> rgb(kWidth * kHeight * 3);
    for (std::size_t i = 0; i < rgb.size(); ++i) rgb[i] = static_cast<uint8_t>(i * 7);
    uint8_t* encoded = nullptr;
    const std::size_t encoded_size = WebPEncodeRGB(rgb.data(), kWidth, kHeight, kWidth * 3, 80.0f, &encoded);
    ASSERT_GT(encoded_size, 0u);

    const WebPData image{encoded, encoded_size};
    WebPMux* mux = WebPMuxCreate(&image, 1);
    WebPFree(encoded);
    ASSERT_NE(mux, nullptr);

    const std::string exif = std::string("Exif\0\0", 6) + "Artist Jane Doe";
    const std::string xmp = "<x:xmpmeta><dc:creator>Jane Doe</dc:creator></x:xmpmeta>";
    const WebPData exif_data{reinterpret_cast<const uint8_t*>(exif.data()), exif.size()};
    const WebPData xmp_data{reinterpret_cast<const uint8_t*>(xmp.data()), xmp.size()};
    ASSERT_EQ(WebPMuxSetChunk(mux, "EXIF", &exif_data, 1), WEBP_MUX_OK);
    ASSERT_EQ(WebPMuxSetChunk(mux, "XMP ", &xmp_data, 1), WEBP_MUX_OK);

    WebPData assembled;
    WebPDataInit(&assembled);
    ASSERT_EQ(WebPMuxAssemble(mux, &assembled), WEBP_MUX_OK);
    WebPMuxDelete(mux);
    write_file(path, std::string(reinterpret_cast<const char*>(assembled.bytes), assembled.size));
    WebPDataClear(&assembled);
}

// True if the WebP at @p path still has a chunk with the given fourcc.
bool webp_has_chunk(const fs::path& path, const char* fourcc) {
    const std::string bytes = read_file(path);
    const WebPData data{reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
    WebPMux* mux = WebPMuxCreate(&data, 0);
    if (!mux) return false;
    WebPData chunk;
    const bool found = WebPMuxGetChunk(mux, fourcc, &chunk) == WEBP_MUX_OK;
    WebPMuxDelete(mux);
    return found;
}

unsigned read_be32(const std::string& bytes, std::size_t offset) {
    return (static_cast<unsigned char>(bytes[offset]) << 24) |
           (static_cast<unsigned char>(bytes[offset + 1]) << 16) |
           (static_cast<unsigned char>(bytes[offset + 2]) << 8) |
           static_cast<unsigned char>(bytes[offset + 3]);
}

TEST(ImageLibraryStrategyTest, PngLosesTextChunks) {
    TempDir dir;
    const fs::path png = dir / "drawing.png";
    write_tagged_png(png);
    ASSERT_NE(read_file(png).find("Jane Doe"), std::string::npos);

    Logger logger;
    ImageLibraryStrategy strategy(logger);
    ASSERT_TRUE(strategy.attempt(png, {}));

    const std::string bytes = read_file(png);
    EXPECT_EQ(bytes.find("tEXt"), std::string::npos);
    EXPECT_EQ(bytes.find("Jane Doe"), std::string::npos);
    ASSERT_GT(bytes.size(), 24u);
    EXPECT_EQ(bytes.substr(12, 4), "IHDR");
    EXPECT_EQ(read_be32(bytes, 16), static_cast<unsigned>(kWidth));
    EXPECT_EQ(read_be32(bytes, 20), static_cast<unsigned>(kHeight));
    EXPECT_NE(bytes.find("IDAT"), std::string::npos);
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(ImageLibraryStrategyTest, JpegLosesMarkersButKeepsPixels) {
    TempDir dir;
    const fs::path jpg = dir / "IMG_0001.JPG";
    write_tagged_jpeg(jpg);
    ASSERT_NE(read_file(jpg).find("Jane Doe"), std::string::npos);

    Logger logger;
    ImageLibraryStrategy strategy(logger);
    ASSERT_TRUE(strategy.attempt(jpg, {}));

    const std::string bytes = read_file(jpg);
    EXPECT_EQ(bytes.find("Jane Doe"), std::string::npos);
    EXPECT_EQ(bytes.find("Exif"), std::string::npos);
    ASSERT_GE(bytes.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0xFF);
    EXPECT_EQ(static_cast<unsigned char>(bytes[1]), 0xD8);
    EXPECT_EQ(jpeg_dimensions(jpg), (std::pair<unsigned, unsigned>{kWidth, kHeight}));
}

TEST(ImageLibraryStrategyTest, CorruptJpegLeavesOriginal) {
    TempDir dir;
    const fs::path jpg = dir / "broken.jpg";
    write_file(jpg, "this is not a jpeg at all");

    Logger logger;
    ImageLibraryStrategy strategy(logger);
    EXPECT_FALSE(strategy.attempt(jpg, {}));
    EXPECT_EQ(read_file(jpg), "this is not a jpeg at all");
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(ImageLibraryStrategyTest, CorruptPngLeavesOriginal) {
    TempDir dir;
    const fs::path png = dir / "broken.png";
    write_file(png, "\x89PNG\r\n\x1a\n garbage");

    Logger logger;
    ImageLibraryStrategy strategy(logger);
    EXPECT_FALSE(strategy.attempt(png, {}));
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(ImageLibraryStrategyTest, WebpLosesExifAndXmpChunks) {
    TempDir dir;
    const fs::path webp = dir / "sticker.webp";
    write_tagged_webp(webp);
    ASSERT_TRUE(webp_has_chunk(webp, "EXIF"));
    ASSERT_TRUE(webp_has_chunk(webp, "XMP "));

    Logger logger;
    ImageLibraryStrategy strategy(logger);
    ASSERT_TRUE(strategy.attempt(webp, {}));

    EXPECT_FALSE(webp_has_chunk(webp, "EXIF"));
    EXPECT_FALSE(webp_has_chunk(webp, "XMP "));
    const std::string bytes = read_file(webp);
    EXPECT_EQ(bytes.find("Jane Doe"), std::string::npos);
    EXPECT_NE(bytes.find("VP8"), std::string::npos);
    int width = 0;
    int height = 0;
    ASSERT_TRUE(WebPGetInfo(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(), &width, &height));
    EXPECT_EQ(width, kWidth);
    EXPECT_EQ(height, kHeight);
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(ImageLibraryStrategyTest, CorruptWebpLeavesOriginal) {
    TempDir dir;
    const fs::path webp = dir / "broken.webp";
    const std::string garbage = std::string("RIFF\x10\0\0\0WEBP", 12) + "not a chunk";
    write_file(webp, garbage);

    Logger logger;
    ImageLibraryStrategy strategy(logger);
    EXPECT_FALSE(strategy.attempt(webp, {}));
    EXPECT_EQ(read_file(webp), garbage);
    EXPECT_EQ(list_dir(dir.path()).size(), 1u);
}

TEST(ImageLibraryStrategyTest, FormatsWithoutRewriterAreDeclined) {
    TempDir dir;
    const fs::path tiff = dir / "scan.tiff";
    write_file(tiff, "II*");

    Logger logger;
    ImageLibraryStrategy strategy(logger);
    EXPECT_FALSE(strategy.attempt(tiff, {}));
    EXPECT_EQ(read_file(tiff), "II*");
}

} // namespace
} // namespace metawipe
