#include "split_job_engine.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "file_utils.hpp"
#include "hierarchical_splitter.hpp"
#include "logger.hpp"
#include "random_utils.hpp"
#include "range_resolver.hpp"
#include <algorithm>
#include <optional>
#include <thread>

namespace tocsplit {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "JobEngine";
constexpr int kSplitProgressCeiling = 95;

unsigned effective_threads(const unsigned requested) {
    if (requested > 0) {
        return requested;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

std::string document_name_of(const DocumentHandle& handle) {
    std::string stem = fs::path(handle.source_name()).stem().string();
    return stem.empty() ? "document" : stem;
}

} // namespace

SplitJobEngine::SplitJobEngine(JobStore& store, EventBus& bus, EngineOptions options)
    : store_(store),
      bus_(bus),
      options_(std::move(options)),
      pool_(effective_threads(options_.max_concurrent_jobs)) {
    Logger::log(LogLevel::Debug, "Engine started with " + std::to_string(pool_.size()) +
                " workers, work dir " + options_.work_dir.string(), kTag);
}

SplitJobEngine::~SplitJobEngine() {
    pool_.wait_idle();
}

std::string SplitJobEngine::submit(DocumentHandle handle, TocTree toc) {
    if (!handle.is_open()) {
        throw DocumentClosed();
    }

    SplitJob job;
    job.id = RandomUtils::uuid_v4();
    job.status = JobStatus::Queued;
    job.document_name = document_name_of(handle);
    const std::string id = job.id;
    const std::string document_name = job.document_name;
    store_.insert(std::move(job));

    Logger::log(LogLevel::Info, "Queued job " + id + " for " + handle.source_name(), kTag);
    bus_.publish(JobQueuedEvent{id, document_name});

    pool_.enqueue([this, id, handle = std::move(handle), toc = std::move(toc)](std::stop_token) mutable {
        run_job(id, handle, toc);
        handle.close();
    });
    return id;
}

SplitJob SplitJobEngine::get_status(const std::string& id) const {
    return store_.get(id);
}

fs::path SplitJobEngine::get_output(const std::string& id) const {
    const SplitJob job = store_.get(id);
    if (job.status != JobStatus::Completed || !job.output_path) {
        throw JobNotReady(id, job_status_to_string(job.status));
    }
    return *job.output_path;
}

void SplitJobEngine::wait_idle() {
    pool_.wait_idle();
}

void SplitJobEngine::report_progress(const std::string& id, const int progress) {
    store_.update(id, [progress](SplitJob& job) { job.progress = progress; });
    bus_.publish(JobProgressEvent{id, progress});
}

void SplitJobEngine::fail_job(const std::string& id, const std::string& message) {
    Logger::log(LogLevel::Error, "Job " + id + " failed: " + message, kTag);
    store_.update(id, [&message](SplitJob& job) {
        job.status = JobStatus::Failed;
        job.error = message;
    });
    try {
        bus_.publish(JobFailedEvent{id, message});
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Failure handler for job " + id + " threw: " + e.what(), kTag);
    }
}

void SplitJobEngine::run_job(const std::string& id, DocumentHandle& handle, const TocTree& toc) {
    store_.update(id, [](SplitJob& job) {
        job.status = JobStatus::InProgress;
        job.progress = 0;
    });

    std::optional<JobCompletedEvent> completed;
    try {
        const TocTree resolved = RangeResolver::resolve(toc, handle.page_count());
        const std::size_t total = count_nodes(resolved);
        bus_.publish(JobStartedEvent{id, total});
        bus_.publish(JobProgressEvent{id, 0});

        const fs::path tree_root = options_.work_dir / id / sanitize_title(document_name_of(handle));

        const HierarchicalSplitter splitter;
        std::vector<SplitOutput> outputs = splitter.split(
            handle, resolved, tree_root,
            [this, &id](const int percent) {
                report_progress(id, percent * kSplitProgressCeiling / 100);
            },
            [this, &id](const SplitOutput& output, const fs::path& path) {
                bus_.publish(SectionWrittenEvent{id, path, output.number, output.title,
                                                 output.start_page, output.end_page});
            });

        const std::size_t files_written = outputs.size();
        store_.update(id, [&](SplitJob& job) {
            job.output_root = tree_root;
            job.outputs = std::move(outputs);
        });

        fs::path output_path = tree_root;
        if (options_.archive) {
            const Archiver archiver(options_.archive_format);
            output_path = archiver.archive(tree_root, id);
        }

        store_.update(id, [&output_path](SplitJob& job) {
            job.status = JobStatus::Completed;
            job.progress = 100;
            job.output_path = output_path;
        });
        Logger::log(LogLevel::Info, "Job " + id + " completed: " + std::to_string(files_written) +
                    " files, output " + output_path.string(), kTag);
        completed = JobCompletedEvent{id, output_path, files_written};
    } catch (const std::exception& e) {
        fail_job(id, e.what());
        return;
    }

    // the job is terminal from here on; a throwing subscriber must not touch its record
    try {
        bus_.publish(JobProgressEvent{id, 100});
        bus_.publish(*completed);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Completion handler for job " + id + " threw: " + e.what(), kTag);
    }
}

} // namespace tocsplit
