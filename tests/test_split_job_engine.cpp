#include <gtest/gtest.h>
#include "errors.hpp"
#include "events.hpp"
#include "pdf_fixtures.hpp"
#include "split_job_engine.hpp"
#include "toc_extractor.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <vector>

using namespace tocsplit;
using tocsplit::fixtures::TempDir;
namespace fs = std::filesystem;

namespace {

TocNode chapter(const std::string& title, const int page) {
    TocNode n;
    n.title = title;
    n.start_page = page;
    return n;
}

class SplitJobEngineTest : public ::testing::Test {
protected:
    SplitJobEngineTest() {
        options.work_dir = dir.path() / "work";
        options.max_concurrent_jobs = 2;
    }

    DocumentHandle book() const {
        return DocumentHandle::open(fixtures::make_pdf(20, fixtures::chapter_outline()), "book.pdf");
    }

    static TocTree outline_toc(const DocumentHandle& handle) {
        return TocExtractor().extract(handle);
    }

    TempDir dir;
    JobStore store;
    EventBus bus;
    EngineOptions options;
};

} // namespace

TEST_F(SplitJobEngineTest, JobRunsToCompletion) {
    std::mutex mtx;
    std::vector<JobStatus> seen;
    std::vector<int> progress;

    bus.subscribe<JobQueuedEvent>([&](const JobQueuedEvent& e) {
        std::lock_guard lock(mtx);
        seen.push_back(store.get(e.job_id).status);
    });
    bus.subscribe<JobStartedEvent>([&](const JobStartedEvent& e) {
        std::lock_guard lock(mtx);
        seen.push_back(store.get(e.job_id).status);
        EXPECT_EQ(e.total_sections, 3u);
    });
    bus.subscribe<JobProgressEvent>([&](const JobProgressEvent& e) {
        std::lock_guard lock(mtx);
        progress.push_back(e.progress);
    });
    bus.subscribe<JobCompletedEvent>([&](const JobCompletedEvent& e) {
        std::lock_guard lock(mtx);
        seen.push_back(store.get(e.job_id).status);
        EXPECT_EQ(e.files_written, 3u);
    });

    SplitJobEngine engine(store, bus, options);
    DocumentHandle handle = book();
    TocTree toc = outline_toc(handle);
    const std::string id = engine.submit(std::move(handle), std::move(toc));
    engine.wait_idle();

    EXPECT_EQ(seen, (std::vector<JobStatus>{JobStatus::Queued, JobStatus::InProgress, JobStatus::Completed}));
    ASSERT_FALSE(progress.empty());
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    EXPECT_EQ(progress.back(), 100);
    EXPECT_LE(progress[progress.size() - 2], 95);

    const SplitJob job = engine.get_status(id);
    EXPECT_EQ(job.status, JobStatus::Completed);
    EXPECT_EQ(job.progress, 100);
    EXPECT_FALSE(job.error.has_value());
    EXPECT_EQ(job.document_name, "book");
    ASSERT_EQ(job.outputs.size(), 3u);

    const fs::path tree_root = options.work_dir / id / "book";
    EXPECT_EQ(job.output_root, tree_root);
    EXPECT_TRUE(fs::is_regular_file(tree_root / "1_Ch1" / "1_Ch1.pdf"));
    EXPECT_TRUE(fs::is_regular_file(tree_root / "1_Ch1" / "1.1_1.1.pdf"));
    EXPECT_TRUE(fs::is_regular_file(tree_root / "2_Ch2.pdf"));

    const fs::path archive = engine.get_output(id);
    EXPECT_EQ(archive, options.work_dir / id / (id + ".zip"));
    const auto entries = Archiver::list_entries(archive);
    EXPECT_NE(std::find(entries.begin(), entries.end(), "book/1_Ch1/1.1_1.1.pdf"), entries.end());
    EXPECT_NE(std::find(entries.begin(), entries.end(), "book/2_Ch2.pdf"), entries.end());
}

TEST_F(SplitJobEngineTest, PollingCompletedJobIsStable) {
    SplitJobEngine engine(store, bus, options);
    DocumentHandle handle = book();
    TocTree toc = outline_toc(handle);
    const std::string id = engine.submit(std::move(handle), std::move(toc));
    engine.wait_idle();

    const SplitJob first = engine.get_status(id);
    const SplitJob second = engine.get_status(id);
    EXPECT_EQ(first, second);
    EXPECT_EQ(engine.get_output(id), engine.get_output(id));
}

TEST_F(SplitJobEngineTest, UnknownJobIsNotFound) {
    SplitJobEngine engine(store, bus, options);
    EXPECT_THROW(static_cast<void>(engine.get_status("no-such-job")), JobNotFound);
    EXPECT_THROW(static_cast<void>(engine.get_output("no-such-job")), JobNotFound);
}

TEST_F(SplitJobEngineTest, StaleChapterFailsJobWithoutAffectingOthers) {
    std::vector<std::string> failures;
    std::mutex mtx;
    bus.subscribe<JobFailedEvent>([&](const JobFailedEvent& e) {
        std::lock_guard lock(mtx);
        failures.push_back(e.job_id);
    });

    SplitJobEngine engine(store, bus, options);

    TocTree stale;
    stale.chapters = {chapter("Intro", 1), chapter("Stale", 30)};
    renumber(stale);
    const std::string bad = engine.submit(book(), stale);

    DocumentHandle handle = book();
    TocTree toc = outline_toc(handle);
    const std::string good = engine.submit(std::move(handle), std::move(toc));

    engine.wait_idle();

    const SplitJob failed = engine.get_status(bad);
    EXPECT_EQ(failed.status, JobStatus::Failed);
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_NE(failed.error->find("Stale"), std::string::npos);
    // one of two files was written before the failure
    EXPECT_EQ(failed.progress, 47);
    EXPECT_FALSE(failed.output_path.has_value());
    EXPECT_THROW(static_cast<void>(engine.get_output(bad)), JobNotReady);

    EXPECT_EQ(engine.get_status(good).status, JobStatus::Completed);
    EXPECT_EQ(failures, std::vector<std::string>{bad});
}

TEST_F(SplitJobEngineTest, ArchiveFailureKeepsSplitOutput) {
    // a directory squatting on the archive path makes libarchive fail to open it
    bus.subscribe<SectionWrittenEvent>([this](const SectionWrittenEvent& e) {
        std::error_code ec;
        fs::create_directories(options.work_dir / e.job_id / (e.job_id + ".zip"), ec);
    });

    SplitJobEngine engine(store, bus, options);
    DocumentHandle handle = book();
    TocTree toc = outline_toc(handle);
    const std::string id = engine.submit(std::move(handle), std::move(toc));
    engine.wait_idle();

    const SplitJob job = engine.get_status(id);
    EXPECT_EQ(job.status, JobStatus::Failed);
    ASSERT_TRUE(job.error.has_value());
    EXPECT_NE(job.error->find("archive"), std::string::npos) << *job.error;
    EXPECT_FALSE(job.output_path.has_value());
    EXPECT_EQ(job.progress, 95);

    ASSERT_TRUE(job.output_root.has_value());
    EXPECT_EQ(*job.output_root, options.work_dir / id / "book");
    ASSERT_EQ(job.outputs.size(), 3u);
    for (const auto& output : job.outputs) {
        EXPECT_TRUE(fs::is_regular_file(*job.output_root / output.relative_path)) << output.relative_path;
    }
    EXPECT_THROW(static_cast<void>(engine.get_output(id)), JobNotReady);
}

TEST_F(SplitJobEngineTest, ThrowingCompletionSubscriberLeavesJobCompleted) {
    std::vector<std::string> failures;
    std::mutex mtx;
    bus.subscribe<JobCompletedEvent>([](const JobCompletedEvent&) {
        throw std::runtime_error("subscriber exploded");
    });
    bus.subscribe<JobFailedEvent>([&](const JobFailedEvent& e) {
        std::lock_guard lock(mtx);
        failures.push_back(e.job_id);
    });

    SplitJobEngine engine(store, bus, options);
    DocumentHandle handle = book();
    TocTree toc = outline_toc(handle);
    const std::string id = engine.submit(std::move(handle), std::move(toc));
    engine.wait_idle();

    const SplitJob job = engine.get_status(id);
    EXPECT_EQ(job.status, JobStatus::Completed);
    EXPECT_FALSE(job.error.has_value());
    EXPECT_TRUE(failures.empty());
    EXPECT_TRUE(fs::is_regular_file(engine.get_output(id)));
}

TEST_F(SplitJobEngineTest, EmptyTocFailsJob) {
    SplitJobEngine engine(store, bus, options);
    const std::string id = engine.submit(book(), TocTree{});
    engine.wait_idle();

    const SplitJob job = engine.get_status(id);
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_EQ(job.error, std::string("table of contents has no chapters"));
    EXPECT_EQ(job.progress, 0);
}

TEST_F(SplitJobEngineTest, ArchivingCanBeDisabled) {
    options.archive = false;
    SplitJobEngine engine(store, bus, options);
    DocumentHandle handle = book();
    TocTree toc = outline_toc(handle);
    const std::string id = engine.submit(std::move(handle), std::move(toc));
    engine.wait_idle();

    const SplitJob job = engine.get_status(id);
    EXPECT_EQ(job.status, JobStatus::Completed);
    EXPECT_EQ(job.output_path, job.output_root);
    EXPECT_TRUE(fs::is_directory(engine.get_output(id)));
    EXPECT_FALSE(fs::exists(options.work_dir / id / (id + ".zip")));
}

TEST_F(SplitJobEngineTest, ClosedHandleIsRejectedBeforeQueueing) {
    SplitJobEngine engine(store, bus, options);
    DocumentHandle handle = book();
    handle.close();

    EXPECT_THROW(static_cast<void>(engine.submit(std::move(handle), TocTree{})), DocumentClosed);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(SplitJobEngineTest, DestructorWaitsForJobs) {
    std::vector<std::string> ids;
    {
        SplitJobEngine engine(store, bus, options);
        for (int i = 0; i < 4; ++i) {
            DocumentHandle handle = book();
            TocTree toc = outline_toc(handle);
            ids.push_back(engine.submit(std::move(handle), std::move(toc)));
        }
    }
    for (const auto& id : ids) {
        EXPECT_EQ(store.get(id).status, JobStatus::Completed) << id;
    }
    // ids are unique
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(std::adjacent_find(ids.begin(), ids.end()), ids.end());
}
