#include <gtest/gtest.h>
#include "document_handle.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "mime_detector.hpp"
#include "pdf_fixtures.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace tocsplit;
using tocsplit::fixtures::Bookmark;
using tocsplit::fixtures::TempDir;

TEST(DocumentHandleTest, OpensFileAndCountsPages) {
    const TempDir dir;
    const auto path = fixtures::write_pdf(dir.path() / "book.pdf", 7);

    const DocumentHandle handle = DocumentHandle::open(path);
    EXPECT_TRUE(handle.is_open());
    EXPECT_EQ(handle.page_count(), 7);
    EXPECT_EQ(handle.source_name(), "book.pdf");
}

TEST(DocumentHandleTest, OpensInMemoryDocument) {
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(3), "upload.pdf");
    EXPECT_EQ(handle.page_count(), 3);
    EXPECT_EQ(handle.source_name(), "upload.pdf");
}

TEST(DocumentHandleTest, MissingFileIsNotFound) {
    const TempDir dir;
    EXPECT_THROW(static_cast<void>(DocumentHandle::open(dir.path() / "nope.pdf")), DocumentNotFound);
}

TEST(DocumentHandleTest, TextFileIsCorrupt) {
    const TempDir dir;
    const auto path = dir.path() / "notes.pdf";
    const std::string text = "These are plain text notes, not a PDF.\n";
    write_file(path, std::vector<unsigned char>(text.begin(), text.end()));

    EXPECT_THROW(static_cast<void>(DocumentHandle::open(path)), CorruptDocument);
}

TEST(DocumentHandleTest, TruncatedPdfIsCorrupt) {
    const std::string text = "%PDF-1.4\n1 0 obj\n<< /Type /Cat";
    EXPECT_THROW(static_cast<void>(DocumentHandle::open(std::vector<unsigned char>(text.begin(), text.end()), "bad.pdf")),
                 CorruptDocument);
}

TEST(DocumentHandleTest, EmptyBufferIsCorrupt) {
    EXPECT_THROW(static_cast<void>(DocumentHandle::open(std::vector<unsigned char>{}, "empty.pdf")), CorruptDocument);
}

TEST(DocumentHandleTest, ExtractPagesBuildsStandaloneDocument) {
    const TempDir dir;
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(10), "ten.pdf");

    const auto bytes = handle.extract_pages(3, 6);
    EXPECT_EQ(MimeDetector::detect(bytes.data(), bytes.size()), "application/pdf");

    const auto part = dir.path() / "part.pdf";
    write_file(part, bytes);
    EXPECT_EQ(fixtures::count_pages(part), 4);

    const DocumentHandle reopened = DocumentHandle::open(part);
    EXPECT_EQ(reopened.page_count(), 4);
}

TEST(DocumentHandleTest, WritePagesWritesSinglePage) {
    const TempDir dir;
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(5), "five.pdf");

    const auto out = dir.path() / "last.pdf";
    handle.write_pages(5, 5, out);
    EXPECT_EQ(fixtures::count_pages(out), 1);
}

TEST(DocumentHandleTest, InvalidRangesAreRejected) {
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(5), "five.pdf");

    EXPECT_THROW(static_cast<void>(handle.extract_pages(0, 2)), InvalidRange);
    EXPECT_THROW(static_cast<void>(handle.extract_pages(4, 3)), InvalidRange);
    EXPECT_THROW(static_cast<void>(handle.extract_pages(5, 6)), InvalidRange);
    EXPECT_THROW(static_cast<void>(handle.extract_pages(9, 9)), InvalidRange);
}

TEST(DocumentHandleTest, ReadsOutlineInDocumentOrder) {
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(20, fixtures::chapter_outline()), "b.pdf");

    const std::vector<OutlineEntry> expected{
        {"Ch1", 0, 1},
        {"1.1", 1, 3},
        {"Ch2", 0, 10},
    };
    EXPECT_EQ(handle.read_outline(), expected);
}

TEST(DocumentHandleTest, OutlineEntryWithoutDestinationInheritsPreviousPage) {
    const std::vector<Bookmark> outline{
        {"Start", 4, {}},
        {"Dangling", 0, {}},
        {"End", 8, {}},
    };
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(10, outline), "d.pdf");

    const auto entries = handle.read_outline();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1].title, "Dangling");
    EXPECT_EQ(entries[1].target_page, 4);
    EXPECT_EQ(entries[2].target_page, 8);
}

TEST(DocumentHandleTest, DocumentWithoutOutlineHasNoEntries) {
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(2), "plain.pdf");
    EXPECT_TRUE(handle.read_outline().empty());
}

TEST(DocumentHandleTest, InfoReportsPagesAndSize) {
    const TempDir dir;
    const auto path = fixtures::write_pdf(dir.path() / "info.pdf", 4);

    const DocumentHandle handle = DocumentHandle::open(path);
    const DocumentInfo info = handle.info();
    EXPECT_EQ(info.source_name, "info.pdf");
    EXPECT_EQ(info.page_count, 4);
    EXPECT_EQ(info.file_size, std::filesystem::file_size(path));
    EXPECT_FALSE(info.encrypted);
    EXPECT_FALSE(info.pdf_version.empty());
}

TEST(DocumentHandleTest, UnencryptedDocumentGrantsEveryPermission) {
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(1), "open.pdf");
    const DocumentPermissions permissions = handle.info().permissions;
    EXPECT_TRUE(permissions.print);
    EXPECT_TRUE(permissions.copy);
    EXPECT_TRUE(permissions.modify);
    EXPECT_TRUE(permissions.annotate);
}

TEST(DocumentHandleTest, RestrictedDocumentReportsPermissions) {
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_restricted_pdf(2), "locked.pdf");
    const DocumentInfo info = handle.info();
    EXPECT_TRUE(info.encrypted);
    EXPECT_EQ(info.page_count, 2);
    EXPECT_EQ(info.permissions, (DocumentPermissions{false, false, false, false}));

    // restrictions do not stop the split itself
    const auto part = handle.extract_pages(2, 2);
    const DocumentHandle reopened = DocumentHandle::open(part, "part.pdf");
    EXPECT_EQ(reopened.page_count(), 1);
}

TEST(DocumentHandleTest, ClosedHandleRejectsOperations) {
    DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(2), "c.pdf");
    handle.close();
    handle.close();

    EXPECT_FALSE(handle.is_open());
    EXPECT_THROW(static_cast<void>(handle.page_count()), DocumentClosed);
    EXPECT_THROW(static_cast<void>(handle.extract_pages(1, 1)), DocumentClosed);
    EXPECT_THROW(static_cast<void>(handle.read_outline()), DocumentClosed);
}

TEST(DocumentHandleTest, MovedFromHandleIsClosed) {
    DocumentHandle first = DocumentHandle::open(fixtures::make_pdf(2), "m.pdf");
    DocumentHandle second = std::move(first);

    EXPECT_TRUE(second.is_open());
    EXPECT_EQ(second.page_count(), 2);
    EXPECT_THROW(static_cast<void>(first.page_count()), DocumentClosed);
}

TEST(DocumentHandleTest, ConcurrentExtractionIsSerialized) {
    const DocumentHandle handle = DocumentHandle::open(fixtures::make_pdf(12), "shared.pdf");

    std::vector<std::size_t> sizes(4);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&handle, &sizes, t] {
            sizes[static_cast<std::size_t>(t)] = handle.extract_pages(t * 3 + 1, t * 3 + 3).size();
        });
    }
    for (auto& th : threads) th.join();

    for (const auto size : sizes) {
        EXPECT_GT(size, 0u);
    }
}
