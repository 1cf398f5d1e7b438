#ifndef TOCSPLIT_TESTS_PDF_FIXTURES_HPP
#define TOCSPLIT_TESTS_PDF_FIXTURES_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace tocsplit::fixtures {

/// Bookmark in a synthesized outline; page 0 leaves the destination out.
struct Bookmark {
    std::string title;
    int page = 1;
    std::vector<Bookmark> kids;
};

/**
 * @brief Builds a PDF with `pages` pages, each carrying a small vector
 * drawing, and an optional outline.
 */
std::vector<unsigned char> make_pdf(int pages, const std::vector<Bookmark>& outline = {});

/**
 * @brief make_pdf() with a three chapter outline whose items are broken:
 * a non-string title, a destination naming nothing, a child pointer that is
 * not an object reference and a /Next chain that loops back to the start.
 */
std::vector<unsigned char> make_pdf_with_damaged_outline(int pages);

/// make_pdf() encrypted with an empty user password that grants no permissions.
std::vector<unsigned char> make_restricted_pdf(int pages);

/// make_pdf() written to path; returns path.
std::filesystem::path write_pdf(const std::filesystem::path& path, int pages,
                                const std::vector<Bookmark>& outline = {});

/// Page count of a PDF on disk, read back with qpdf.
int count_pages(const std::filesystem::path& path);

/// Outline from the Scenario B example: Ch1 -> 1.1, then Ch2.
std::vector<Bookmark> chapter_outline();

/// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace tocsplit::fixtures

#endif // TOCSPLIT_TESTS_PDF_FIXTURES_HPP
