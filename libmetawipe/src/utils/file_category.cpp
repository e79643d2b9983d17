#include "../../include/file_category.hpp"
#include <algorithm>
#include <cctype>

namespace metawipe {

std::string normalize_extension(const std::string_view ext) {
    std::string out(ext);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

FileCategory classify(const std::filesystem::path& path) {
    const std::string ext = normalize_extension(path.extension().string());
    if (ext.empty()) {
        return FileCategory::Unknown;
    }
    const auto it = std::find_if(kExtensionTable.begin(), kExtensionTable.end(),
                                 [&](const auto& entry) { return entry.first == ext; });
    return it != kExtensionTable.end() ? it->second : FileCategory::Unknown;
}

std::string_view category_to_string(const FileCategory category) noexcept {
    switch (category) {
        case FileCategory::Image:   return "image";
        case FileCategory::Video:   return "video";
        case FileCategory::Pdf:     return "pdf";
        case FileCategory::Docx:    return "docx";
        case FileCategory::Xlsx:    return "xlsx";
        case FileCategory::Pptx:    return "pptx";
        case FileCategory::Audio:   return "audio";
        case FileCategory::Archive: return "archive";
        case FileCategory::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace metawipe
