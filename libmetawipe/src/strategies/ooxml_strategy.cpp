#include "../../include/ooxml_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <memory>
#include <regex>
#include <stdexcept>
#include <vector>

namespace metawipe {

namespace fs = std::filesystem;

/**
 * @brief Returns the tag used for logging by this strategy.
 */
static const char* strategy_tag() {
    return "ooxml";
}

namespace {

struct ReadArchiveDeleter {
    void operator()(archive* a) const { if (a) archive_read_free(a); }
};
struct WriteArchiveDeleter {
    void operator()(archive* a) const { if (a) archive_write_free(a); }
};
using read_archive_ptr = std::unique_ptr<archive, ReadArchiveDeleter>;
using write_archive_ptr = std::unique_ptr<archive, WriteArchiveDeleter>;

struct PackagePart {
    std::string name;
    std::vector<unsigned char> data;
};

constexpr std::string_view kCorePart = "docProps/core.xml";
constexpr std::string_view kAppPart = "docProps/app.xml";
constexpr std::string_view kCustomPart = "docProps/custom.xml";
constexpr std::string_view kContentTypes = "[Content_Types].xml";

const char* error_of(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

std::vector<PackagePart> read_package(const fs::path& input, Logger& logger) {
    const read_archive_ptr in(archive_read_new());
    if (!in) {
        throw std::runtime_error("archive_read_new failed");
    }
    archive_read_support_format_zip(in.get());

    const int open_r = archive_read_open_filename(in.get(), input.string().c_str(), 10240);
    if (open_r == ARCHIVE_WARN) {
        logger.warning(std::string("LIBARCHIVE WARN: ") + error_of(in.get()), strategy_tag());
    } else if (open_r != ARCHIVE_OK) {
        throw std::runtime_error(std::string("Failed to open package: ") + error_of(in.get()));
    }

    std::vector<PackagePart> parts;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK) {
        const char* ename = archive_entry_pathname(entry);
        if (!ename || archive_entry_filetype(entry) == AE_IFDIR) {
            archive_read_data_skip(in.get());
            continue;
        }

        PackagePart part;
        part.name = ename;

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rb = archive_read_data_block(in.get(), &buff, &size, &offset);
            if (rb == ARCHIVE_EOF) break;
            if (rb != ARCHIVE_OK) {
                throw std::runtime_error("Error reading " + part.name + ": " + error_of(in.get()));
            }
            const auto *bytes = static_cast<const unsigned char*>(buff);
            part.data.insert(part.data.end(), bytes, bytes + size);
        }
        parts.push_back(std::move(part));
    }
    if (r != ARCHIVE_EOF) {
        throw std::runtime_error(std::string("Iteration error: ") + error_of(in.get()));
    }
    archive_read_close(in.get());
    return parts;
}

void write_package(const fs::path& output, const std::vector<PackagePart>& parts, Logger& logger) {
    const write_archive_ptr out(archive_write_new());
    if (!out) {
        throw std::runtime_error("archive_write_new failed");
    }

    const int set_fmt = archive_write_set_format_zip(out.get());
    if (set_fmt == ARCHIVE_WARN) {
        logger.warning(std::string("LIBARCHIVE WARN: ") + error_of(out.get()), strategy_tag());
    } else if (set_fmt != ARCHIVE_OK) {
        throw std::runtime_error(std::string("Failed to set ZIP format: ") + error_of(out.get()));
    }
    archive_write_set_options(out.get(), "compression=deflate");

    if (archive_write_open_filename(out.get(), output.string().c_str()) != ARCHIVE_OK) {
        throw std::runtime_error(std::string("Failed to open temp package: ") + error_of(out.get()));
    }

    for (const auto& part : parts) {
        archive_entry* entry = archive_entry_new();
        if (!entry) {
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(entry, part.name.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(part.data.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_mtime(entry, 0, 0);

        const int wh = archive_write_header(out.get(), entry);
        archive_entry_free(entry);
        if (wh != ARCHIVE_OK && wh != ARCHIVE_WARN) {
            throw std::runtime_error("Failed to write header for " + part.name + ": " + error_of(out.get()));
        }
        if (!part.data.empty() &&
            archive_write_data(out.get(), part.data.data(), part.data.size()) < 0) {
            throw std::runtime_error("Failed to write data for " + part.name + ": " + error_of(out.get()));
        }
    }

    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        throw std::runtime_error(std::string("Failed to close package: ") + error_of(out.get()));
    }
}

std::vector<unsigned char> to_bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

std::string OoxmlStrategy::empty_core_properties() {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
           "<cp:coreProperties"
           " xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\""
           " xmlns:dc=\"http://purl.org/dc/elements/1.1/\""
           " xmlns:dcterms=\"http://purl.org/dc/terms/\""
           " xmlns:dcmitype=\"http://purl.org/dc/dcmitype/\""
           " xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">"
           "<dc:title></dc:title>"
           "<dc:subject></dc:subject>"
           "<dc:creator></dc:creator>"
           "<cp:keywords></cp:keywords>"
           "<dc:description></dc:description>"
           "<cp:lastModifiedBy></cp:lastModifiedBy>"
           "<cp:category></cp:category>"
           "<cp:contentStatus></cp:contentStatus>"
           "</cp:coreProperties>";
}

std::string OoxmlStrategy::scrub_app_properties(const std::string& app_xml) {
    static const std::regex kBlanked[] = {
        std::regex(R"((<Company>)[\s\S]*?(</Company>))"),
        std::regex(R"((<Manager>)[\s\S]*?(</Manager>))"),
        std::regex(R"((<Template>)[\s\S]*?(</Template>))"),
    };
    std::string result = app_xml;
    for (const auto& re : kBlanked) {
        result = std::regex_replace(result, re, "$1$2");
    }
    return result;
}

static std::string empty_custom_properties() {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
           "<Properties"
           " xmlns=\"http://schemas.openxmlformats.org/officeDocument/2006/custom-properties\""
           " xmlns:vt=\"http://schemas.openxmlformats.org/officeDocument/2006/docPropsVTypes\"/>";
}

bool OoxmlStrategy::attempt(const fs::path& path, const CleanOptions& /*options*/) {
    const std::string ext = normalize_extension(path.extension().string());
    if (ext == ".doc" || ext == ".xls" || ext == ".ppt") {
        logger_.info("Legacy binary Office format is not supported: " + path.string(), strategy_tag());
        return false;
    }

    TempFile temp(path, "ooxml", logger_);
    try {
        std::vector<PackagePart> parts = read_package(path, logger_);

        const bool is_package = std::any_of(parts.begin(), parts.end(),
                                            [](const PackagePart& p) { return p.name == kContentTypes; });
        if (!is_package) {
            logger_.warning("Not an OOXML package (no [Content_Types].xml): " + path.string(), strategy_tag());
            return false;
        }

        for (auto& part : parts) {
            if (part.name == kCorePart) {
                part.data = to_bytes(empty_core_properties());
                logger_.debug("Cleared core properties", strategy_tag());
            } else if (part.name == kAppPart) {
                part.data = to_bytes(scrub_app_properties(std::string(part.data.begin(), part.data.end())));
                logger_.debug("Scrubbed extended properties", strategy_tag());
            } else if (part.name == kCustomPart) {
                part.data = to_bytes(empty_custom_properties());
                logger_.debug("Cleared custom properties", strategy_tag());
            }
        }

        // [Content_Types].xml must be the first entry
        std::stable_partition(parts.begin(), parts.end(),
                              [](const PackagePart& p) { return p.name == kContentTypes; });

        write_package(temp.path(), parts, logger_);
    } catch (const std::exception& e) {
        logger_.error("OOXML rewrite failed for " + path.string() + ": " + e.what(), strategy_tag());
        return false;
    }

    if (!temp.commit()) {
        return false;
    }
    logger_.debug("OOXML package rewritten: " + path.string(), strategy_tag());
    return true;
}

} // namespace metawipe
