/**
 * @file archiver.hpp
 * @brief Packs a split output tree into a single archive file.
 */

#ifndef TOCSPLIT_ARCHIVER_HPP
#define TOCSPLIT_ARCHIVER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tocsplit {

enum class ArchiveFormat {
    Zip,   ///< deflate, level 9
    TarGz  ///< pax tar through gzip, level 9
};

[[nodiscard]] std::string archive_format_to_string(ArchiveFormat format);

/// File extension including the leading dot (".zip", ".tar.gz").
[[nodiscard]] std::string archive_extension(ArchiveFormat format);

/// Accepts "zip", "tar.gz" and "tgz", case-insensitive.
[[nodiscard]] std::optional<ArchiveFormat> parse_archive_format(std::string_view name);

/**
 * @brief Writes an archive of a directory tree with libarchive.
 *
 * @details Entry names are relative to the parent of the tree root, so
 * the archive's single top-level entry is the tree directory itself.
 * Directories get explicit entries. Siblings are stored in name order.
 */
class Archiver {
public:
    explicit Archiver(ArchiveFormat format = ArchiveFormat::Zip) : format_(format) {}

    /**
     * @brief Archives tree_root next to itself.
     *
     * @param tree_root Directory to pack.
     * @param archive_name File name of the archive; the format's extension
     *        is appended when missing. Defaults to the tree root's name.
     * @return Path of the written archive, in tree_root's parent directory.
     * @throws ArchiveFailure if the tree is missing or libarchive fails.
     */
    std::filesystem::path archive(const std::filesystem::path& tree_root,
                                  const std::string& archive_name = {}) const;

    /**
     * @brief Archives tree_root into out_path.
     * @throws ArchiveFailure on any error; a partial archive is removed.
     */
    void archive_to(const std::filesystem::path& tree_root, const std::filesystem::path& out_path) const;

    /**
     * @brief Lists the entry names stored in an existing archive.
     * @throws ArchiveFailure if the archive cannot be read.
     */
    [[nodiscard]] static std::vector<std::string> list_entries(const std::filesystem::path& archive_path);

    [[nodiscard]] ArchiveFormat format() const noexcept { return format_; }

private:
    ArchiveFormat format_;
};

} // namespace tocsplit

#endif // TOCSPLIT_ARCHIVER_HPP
