#ifndef METAWIPE_FILE_UTILS_HPP
#define METAWIPE_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace metawipe {

    class Logger;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Builds a unique temporary path beside @p original.
     *
     * The name follows a ".{stem}.metawipe-{tag}-{random}{ext}" pattern: it
     * lives in the same directory (so the final rename never crosses a
     * filesystem) and keeps the original extension (so format-sniffing
     * collaborators still recognise the output). Nothing is created on disk.
     */
    std::filesystem::path make_sibling_temp_path(const std::filesystem::path &original,
                                                 std::string_view tag);

    /**
     * @brief Replaces @p original with @p temp in a single rename.
     *
     * The temp file first takes the original's permission bits. Retries
     * transient sharing/lock violations a few times. On failure the
     * temp file is removed and the original is left untouched.
     * @return true if the original now holds the temp file's content.
     */
    bool replace_file(const std::filesystem::path &temp,
                      const std::filesystem::path &original,
                      Logger &logger,
                      std::string_view tag);

    /**
     * @brief Removes a file if it exists and logs any error.
     */
    void remove_if_exists(const std::filesystem::path &path,
                          Logger &logger,
                          std::string_view tag);

    /**
     * @brief RAII owner of a sibling temp path used by the atomic-replace discipline.
     *
     * Mutating strategies write their complete output to path(), then call
     * commit() which renames it over the original. If commit() is never
     * reached (an exception, a failed write, a failed collaborator), the
     * destructor deletes whatever was left at path(), so the original is
     * never partially overwritten and no artifact remains.
     */
    class TempFile {
    public:
        TempFile(const std::filesystem::path &original, std::string_view tag, Logger &logger);
        ~TempFile();

        TempFile(const TempFile &) = delete;
        TempFile &operator=(const TempFile &) = delete;

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return temp_; }

        /// @return true if the temp file exists and is non-empty.
        [[nodiscard]] bool written() const;

        /**
         * @brief Atomically swap the temp output in place of the original.
         * @return false if the output is missing/empty or the rename failed.
         */
        bool commit();

    private:
        std::filesystem::path original_;
        std::filesystem::path temp_;
        std::string tag_;
        Logger &logger_;
        bool committed_ = false;
    };

    /**
     * @brief Platform application-data directory for logs and backups.
     *
     * %APPDATA%/MetaWipe on Windows, $HOME/.metadata_cleaner elsewhere.
     * Falls back to the system temp directory when neither variable is set.
     */
    std::filesystem::path app_data_dir();

    /// @return Local time formatted as YYYYMMDD_HHMMSS.
    std::string timestamp_for_filename();

} // namespace metawipe

#endif // METAWIPE_FILE_UTILS_HPP
