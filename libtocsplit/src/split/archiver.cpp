#include "archiver.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <system_error>

namespace tocsplit {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "Archiver";

struct WriteDeleter {
    void operator()(archive* a) const noexcept { archive_write_free(a); }
};
struct ReadDeleter {
    void operator()(archive* a) const noexcept { archive_read_free(a); }
};
struct EntryDeleter {
    void operator()(archive_entry* e) const noexcept { archive_entry_free(e); }
};

using WriteArchive = std::unique_ptr<archive, WriteDeleter>;
using ReadArchive = std::unique_ptr<archive, ReadDeleter>;
using Entry = std::unique_ptr<archive_entry, EntryDeleter>;

std::string error_of(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

// ARCHIVE_WARN is logged and tolerated, anything worse throws
void check(archive* a, const int r, const std::string& what) {
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + what + ": " + error_of(a), kTag);
        return;
    }
    if (r != ARCHIVE_OK) {
        throw ArchiveFailure(what + ": " + error_of(a));
    }
}

void configure(archive* a, const ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:
            check(a, archive_write_set_format_zip(a), "archive_write_set_format_zip");
            archive_write_set_format_option(a, "zip", "compression", "deflate");
            archive_write_set_format_option(a, "zip", "compression-level", "9");
            break;
        case ArchiveFormat::TarGz:
            check(a, archive_write_set_format_pax_restricted(a), "archive_write_set_format_pax_restricted");
            check(a, archive_write_add_filter_gzip(a), "archive_write_add_filter_gzip");
            archive_write_set_filter_option(a, "gzip", "compression-level", "9");
            break;
    }
}

// path order puts every directory ahead of its contents
std::vector<fs::path> collect_entries(const fs::path& root) {
    std::vector<fs::path> entries{root};
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code ec2;
        if (it->is_directory(ec2) || it->is_regular_file(ec2)) {
            entries.push_back(it->path());
        }
    }
    if (ec) {
        throw ArchiveFailure("cannot walk " + root.string() + ": " + ec.message());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

void write_entry(archive* a, const fs::path& path, const std::string& name) {
    Entry entry(archive_entry_new());
    if (!entry) {
        throw ArchiveFailure("archive_entry_new failed");
    }
    archive_entry_set_pathname(entry.get(), name.c_str());

    std::error_code ec;
    const bool is_dir = fs::is_directory(path, ec);
    std::uintmax_t size = 0;
    if (is_dir) {
        archive_entry_set_filetype(entry.get(), AE_IFDIR);
        archive_entry_set_perm(entry.get(), 0755);
    } else {
        size = fs::file_size(path, ec);
        if (ec) {
            throw ArchiveFailure("cannot stat " + path.string() + ": " + ec.message());
        }
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    }

    check(a, archive_write_header(a, entry.get()), "archive_write_header (" + name + ")");
    if (is_dir || size == 0) {
        return;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ArchiveFailure("cannot open " + path.string());
    }
    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (archive_write_data(a, buffer.data(), static_cast<size_t>(got)) < 0) {
            throw ArchiveFailure("archive_write_data (" + name + "): " + error_of(a));
        }
    }
}

} // namespace

std::string archive_format_to_string(const ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip: return "zip";
        case ArchiveFormat::TarGz: return "tar.gz";
    }
    return "unknown";
}

std::string archive_extension(const ArchiveFormat format) {
    return "." + archive_format_to_string(format);
}

std::optional<ArchiveFormat> parse_archive_format(const std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "zip") return ArchiveFormat::Zip;
    if (lower == "tar.gz" || lower == "tgz") return ArchiveFormat::TarGz;
    return std::nullopt;
}

fs::path Archiver::archive(const fs::path& tree_root, const std::string& archive_name) const {
    const fs::path root = tree_root.has_filename() ? tree_root : tree_root.parent_path();
    std::string name = archive_name.empty() ? root.filename().string() : archive_name;
    const std::string ext = archive_extension(format_);
    if (!name.ends_with(ext)) {
        name += ext;
    }
    const fs::path out_path = root.parent_path() / name;
    archive_to(root, out_path);
    return out_path;
}

void Archiver::archive_to(const fs::path& tree_root, const fs::path& out_path) const {
    std::error_code ec;
    if (!fs::is_directory(tree_root, ec)) {
        throw ArchiveFailure("not a directory: " + tree_root.string());
    }

    const fs::path base = tree_root.has_filename() ? tree_root.parent_path() : tree_root.parent_path().parent_path();
    const std::vector<fs::path> entries = collect_entries(tree_root);

    try {
        WriteArchive a(archive_write_new());
        if (!a) {
            throw ArchiveFailure("archive_write_new failed");
        }
        configure(a.get(), format_);
        check(a.get(), archive_write_open_filename(a.get(), out_path.string().c_str()), "archive_write_open_filename");

        for (const auto& path : entries) {
            std::string name = path.lexically_relative(base).generic_string();
            if (fs::is_directory(path, ec) && !name.ends_with('/')) {
                name += '/';
            }
            write_entry(a.get(), path, name);
        }

        check(a.get(), archive_write_close(a.get()), "archive_write_close");
    } catch (const ArchiveFailure& e) {
        Logger::log(LogLevel::Error, std::string("Failed to write ") + out_path.string() + ": " + e.what(), kTag);
        fs::remove(out_path, ec);
        throw;
    }

    Logger::log(LogLevel::Info, "Archived " + std::to_string(entries.size()) + " entries into " +
                out_path.string() + " (" + archive_format_to_string(format_) + ")", kTag);
}

std::vector<std::string> Archiver::list_entries(const fs::path& archive_path) {
    ReadArchive a(archive_read_new());
    if (!a) {
        throw ArchiveFailure("archive_read_new failed");
    }
    archive_read_support_format_all(a.get());
    archive_read_support_filter_all(a.get());

    if (archive_read_open_filename(a.get(), archive_path.string().c_str(), 10240) != ARCHIVE_OK) {
        throw ArchiveFailure("cannot open " + archive_path.string() + ": " + error_of(a.get()));
    }

    std::vector<std::string> names;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        names.emplace_back(archive_entry_pathname(entry));
        archive_read_data_skip(a.get());
    }
    if (r != ARCHIVE_EOF) {
        throw ArchiveFailure("cannot read " + archive_path.string() + ": " + error_of(a.get()));
    }
    return names;
}

} // namespace tocsplit
