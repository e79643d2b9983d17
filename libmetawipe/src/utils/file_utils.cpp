#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <system_error>
#include <thread>

namespace metawipe {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts wide-char paths, supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::filesystem::path make_sibling_temp_path(const std::filesystem::path& original,
                                                 const std::string_view tag) {
        const std::string name = "." + original.stem().string() + ".metawipe-" + std::string(tag) +
                                 "-" + RandomUtils::random_suffix() + original.extension().string();
        return original.parent_path() / name;
    }

    bool replace_file(const std::filesystem::path& temp,
                      const std::filesystem::path& original,
                      Logger& logger,
                      const std::string_view tag) {
        std::error_code ec;

        // the cleaned copy must not be more readable than the file it replaces
        const auto original_status = std::filesystem::status(original, ec);
        if (!ec && std::filesystem::exists(original_status)) {
            std::filesystem::permissions(temp, original_status.permissions(),
                                         std::filesystem::perm_options::replace, ec);
            if (ec) {
                logger.warning("Can't copy permissions to " + temp.string() + " (" + ec.message() + ")", tag);
                remove_if_exists(temp, logger, tag);
                return false;
            }
        }
        ec.clear();

        int retries = 10;
        while (retries > 0) {
            std::filesystem::rename(temp, original, ec);
            if (!ec) break;

            // 32/5 are the Windows sharing and access violations
            if (ec.value() != 32 && ec.value() != 5) break;

            logger.debug("Rename failed (sharing/lock violation), retrying in 250ms...", tag);
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            --retries;
        }
        if (ec) {
            logger.error("Rename failed: " + temp.string() + " -> " + original.string() +
                         " (" + ec.message() + ")", tag);
            remove_if_exists(temp, logger, tag);
            return false;
        }
        return true;
    }

    void remove_if_exists(const std::filesystem::path& path, Logger& logger, const std::string_view tag) {
        std::error_code ec;
        const bool removed = std::filesystem::remove(path, ec);
        if (ec) {
            logger.warning("Can't remove " + path.string() + " (" + ec.message() + ")", tag);
        } else if (removed) {
            logger.debug("Removed " + path.string(), tag);
        }
    }

    TempFile::TempFile(const std::filesystem::path& original, const std::string_view tag, Logger& logger)
        : original_(original),
          temp_(make_sibling_temp_path(original, tag)),
          tag_(tag),
          logger_(logger) {}

    TempFile::~TempFile() {
        if (!committed_) {
            remove_if_exists(temp_, logger_, tag_);
        }
    }

    bool TempFile::written() const {
        std::error_code ec;
        const auto size = std::filesystem::file_size(temp_, ec);
        return !ec && size > 0;
    }

    bool TempFile::commit() {
        if (committed_) {
            return true;
        }
        if (!written()) {
            logger_.warning("Temp file is missing or empty: " + temp_.string(), tag_);
            return false;
        }
        committed_ = replace_file(temp_, original_, logger_, tag_);
        return committed_;
    }

    std::filesystem::path app_data_dir() {
#ifdef _WIN32
        if (const char* appdata = std::getenv("APPDATA"); appdata && *appdata) {
            return std::filesystem::path(appdata) / "MetaWipe";
        }
#else
        if (const char* home = std::getenv("HOME"); home && *home) {
            return std::filesystem::path(home) / ".metadata_cleaner";
        }
#endif
        std::error_code ec;
        auto tmp = std::filesystem::temp_directory_path(ec);
        if (ec) tmp = ".";
        return tmp / "metawipe";
    }

    std::string timestamp_for_filename() {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
        return buf;
    }

} // namespace metawipe
