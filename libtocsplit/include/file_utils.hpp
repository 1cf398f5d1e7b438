#ifndef TOCSPLIT_FILE_UTILS_HPP
#define TOCSPLIT_FILE_UTILS_HPP

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tocsplit {

    ///< Longest sanitized title, in bytes, used in output file names.
    inline constexpr std::size_t kMaxTitleBytes = 80;

    /**
     * @brief Opens a file using a filesystem path.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE* open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Writes a buffer to path, replacing any existing file.
     * @throws std::runtime_error on open, short write or close failure.
     */
    void write_file(const std::filesystem::path& path, const std::vector<unsigned char>& data);

    /**
     * @brief Turns a TOC title into a safe file name component.
     *
     * Characters illegal in paths (`<>:"/\|?*` and control characters)
     * are dropped without ending a whitespace run, whitespace runs become
     * a single '_', leading and
     * trailing dots, underscores and spaces are trimmed, and the result is
     * cut to at most max_bytes without splitting a UTF-8 sequence. An
     * empty result becomes "untitled".
     */
    std::string sanitize_title(std::string_view title, std::size_t max_bytes = kMaxTitleBytes);

} // namespace tocsplit

#endif // TOCSPLIT_FILE_UTILS_HPP
