/**
 * @file file_category.hpp
 * @brief Defines the coarse file categories and the extension classifier.
 *
 * Classification is a pure function of the path's extension, compared
 * case-insensitively against a fixed category table. Extensions that are
 * not in the table classify as FileCategory::Unknown.
 */

#ifndef METAWIPE_FILE_CATEGORY_HPP
#define METAWIPE_FILE_CATEGORY_HPP

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace metawipe {

/**
 * @brief Enumerates every category a discovered file can be labelled with.
 */
enum class FileCategory {
    Image,
    Video,
    Pdf,
    Docx,
    Xlsx,
    Pptx,
    Audio,
    Archive,
    Unknown
};

///< Every category in reporting order.
inline constexpr std::array<FileCategory, 9> kAllCategories = {
    FileCategory::Image, FileCategory::Video, FileCategory::Pdf,
    FileCategory::Docx, FileCategory::Xlsx, FileCategory::Pptx,
    FileCategory::Audio, FileCategory::Archive, FileCategory::Unknown
};

///< Fixed extension table (lower-case, including the dot).
inline constexpr std::array<std::pair<std::string_view, FileCategory>, 53> kExtensionTable = {{
    {".jpg", FileCategory::Image}, {".jpeg", FileCategory::Image}, {".png", FileCategory::Image},
    {".webp", FileCategory::Image}, {".tif", FileCategory::Image}, {".tiff", FileCategory::Image},
    {".bmp", FileCategory::Image}, {".gif", FileCategory::Image}, {".heic", FileCategory::Image},
    {".heif", FileCategory::Image}, {".raw", FileCategory::Image}, {".cr2", FileCategory::Image},
    {".nef", FileCategory::Image}, {".dng", FileCategory::Image},

    {".mp4", FileCategory::Video}, {".mov", FileCategory::Video}, {".mkv", FileCategory::Video},
    {".avi", FileCategory::Video}, {".webm", FileCategory::Video}, {".flv", FileCategory::Video},
    {".wmv", FileCategory::Video}, {".m4v", FileCategory::Video}, {".mpg", FileCategory::Video},
    {".mpeg", FileCategory::Video},

    {".pdf", FileCategory::Pdf},

    {".docx", FileCategory::Docx}, {".doc", FileCategory::Docx},
    {".xlsx", FileCategory::Xlsx}, {".xls", FileCategory::Xlsx},
    {".pptx", FileCategory::Pptx}, {".ppt", FileCategory::Pptx},

    {".mp3", FileCategory::Audio}, {".m4a", FileCategory::Audio}, {".flac", FileCategory::Audio},
    {".wav", FileCategory::Audio}, {".ogg", FileCategory::Audio}, {".wma", FileCategory::Audio},
    {".aac", FileCategory::Audio}, {".opus", FileCategory::Audio},

    {".zip", FileCategory::Archive}, {".rar", FileCategory::Archive}, {".7z", FileCategory::Archive},
    {".tar", FileCategory::Archive}, {".gz", FileCategory::Archive}, {".bz2", FileCategory::Archive},

    // aliases accepted by the external tools
    {".jpe", FileCategory::Image}, {".jfif", FileCategory::Image}, {".arw", FileCategory::Image},
    {".orf", FileCategory::Image}, {".3gp", FileCategory::Video}, {".m2ts", FileCategory::Video},
    {".oga", FileCategory::Audio}, {".aiff", FileCategory::Audio}
}};

/**
 * @brief Classify a path by its extension.
 * @param path Any path; only its extension is inspected.
 * @return The matching category, or FileCategory::Unknown.
 */
[[nodiscard]] FileCategory classify(const std::filesystem::path& path);

/**
 * @brief Lower-cases an extension (ASCII only).
 */
[[nodiscard]] std::string normalize_extension(std::string_view ext);

/// @return Lower-case category name (e.g. "image", "unknown").
[[nodiscard]] std::string_view category_to_string(FileCategory category) noexcept;

} // namespace metawipe

#endif // METAWIPE_FILE_CATEGORY_HPP
