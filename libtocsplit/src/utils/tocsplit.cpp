/**
 * @file tocsplit.cpp
 * @brief Implementation of the public Tocsplit API.
 */

#include "tocsplit.hpp"

#include "errors.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "job_store.hpp"
#include "log_sink.hpp"
#include "logger.hpp"
#include "split_job_engine.hpp"
#include "toc_extractor.hpp"
#include "toc_json.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <system_error>

namespace tocsplit {

namespace fs = std::filesystem;

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    const std::atomic<TocsplitObserver*>& observer_;
public:
    explicit BridgeLogSink(const std::atomic<TocsplitObserver*>& obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (auto* observer = observer_.load()) {
            observer->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct Tocsplit::Impl {
    EventBus eventBus;
    JobStore jobStore;

    EngineOptions engineOptions;
    ExtractorOptions extractorOptions;
    NumberingStyle numberingStyle = NumberingStyle::Dotted;

    std::atomic<TocsplitObserver*> observer = nullptr;
    Logger::SinkId bridgeSink = 0;

    mutable std::mutex mtx;                 ///< Guards engine and savedTocs
    std::map<std::string, TocTree> savedTocs;
    std::unique_ptr<SplitJobEngine> engine; ///< Created on first submission

    Impl() {
        setupEventBridging();
    }

    ~Impl() {
        engine.reset();
        if (bridgeSink != 0) {
            Logger::remove_sink(bridgeSink);
        }
    }

    void setupEventBridging() {
        eventBus.subscribe<JobQueuedEvent>([this](const JobQueuedEvent& e) {
            if (auto* obs = observer.load()) obs->onJobQueued(e.job_id, e.document_name);
        });

        eventBus.subscribe<JobProgressEvent>([this](const JobProgressEvent& e) {
            if (auto* obs = observer.load()) obs->onJobProgress(e.job_id, e.progress);
        });

        eventBus.subscribe<SectionWrittenEvent>([this](const SectionWrittenEvent& e) {
            if (auto* obs = observer.load()) obs->onSectionWritten(e.job_id, e.path, e.start_page, e.end_page);
        });

        eventBus.subscribe<JobCompletedEvent>([this](const JobCompletedEvent& e) {
            if (auto* obs = observer.load()) obs->onJobCompleted(e.job_id, e.output_path);
        });

        eventBus.subscribe<JobFailedEvent>([this](const JobFailedEvent& e) {
            if (auto* obs = observer.load()) obs->onJobFailed(e.job_id, e.error_message);
        });
    }

    // key for the saved TOC map; the same file reached through different
    // relative paths maps to one entry
    static std::string documentKey(const fs::path& document) {
        std::error_code ec;
        const fs::path canonical = fs::weakly_canonical(document, ec);
        return (ec ? document : canonical).lexically_normal().string();
    }

    [[nodiscard]] TocTree extract(const DocumentHandle& handle) const {
        TocTree tree = TocExtractor(extractorOptions).extract(handle);
        if (numberingStyle != NumberingStyle::Dotted) {
            renumber(tree, numberingStyle);
        }
        return tree;
    }

    bool engineStarted() const {
        std::lock_guard lock(mtx);
        return engine != nullptr;
    }

    // the engine lives until ~Impl once created
    SplitJobEngine* currentEngine() const {
        std::lock_guard lock(mtx);
        return engine.get();
    }

    void warnIfStarted(const std::string& setting) const {
        if (engineStarted()) {
            Logger::log(LogLevel::Warning, "Ignoring " + setting + ": jobs have already been submitted", "Tocsplit");
        }
    }

    std::string submit(DocumentHandle handle, const fs::path& document, const std::optional<TocTree>& toc) {
        TocTree tree;
        if (toc) {
            tree = *toc;
        } else {
            std::optional<TocTree> saved;
            if (!document.empty()) {
                std::lock_guard lock(mtx);
                const auto it = savedTocs.find(documentKey(document));
                if (it != savedTocs.end()) saved = it->second;
            }
            if (saved) {
                Logger::log(LogLevel::Debug, "Using saved TOC for " + document.string(), "Tocsplit");
                tree = std::move(*saved);
            } else {
                tree = extract(handle);
            }
        }

        if (tree.empty()) {
            throw EmptyTree();
        }
        fill_missing_numbers(tree);
        tree = to_absolute_pages(tree);

        SplitJobEngine* target = nullptr;
        {
            std::lock_guard lock(mtx);
            if (!engine) {
                engine = std::make_unique<SplitJobEngine>(jobStore, eventBus, engineOptions);
            }
            target = engine.get();
        }
        return target->submit(std::move(handle), std::move(tree));
    }
};

Tocsplit::Tocsplit() : impl_(std::make_unique<Impl>()) {}

Tocsplit::~Tocsplit() = default;

Tocsplit::Tocsplit(Tocsplit&&) noexcept = default;
Tocsplit& Tocsplit::operator=(Tocsplit&&) noexcept = default;

Tocsplit& Tocsplit::workDirectory(const fs::path& dir) {
    impl_->warnIfStarted("work directory");
    impl_->engineOptions.work_dir = dir;
    return *this;
}

Tocsplit& Tocsplit::threads(const unsigned val) {
    impl_->warnIfStarted("thread count");
    impl_->engineOptions.max_concurrent_jobs = val;
    return *this;
}

Tocsplit& Tocsplit::archive(const bool val) {
    impl_->warnIfStarted("archive setting");
    impl_->engineOptions.archive = val;
    return *this;
}

Tocsplit& Tocsplit::archiveFormat(const ArchiveFormat format) {
    impl_->warnIfStarted("archive format");
    impl_->engineOptions.archive_format = format;
    return *this;
}

Tocsplit& Tocsplit::fallbackTitle(const std::string& title) {
    impl_->extractorOptions.fallback_title = title;
    return *this;
}

Tocsplit& Tocsplit::minTopLevelEntries(const std::size_t val) {
    impl_->extractorOptions.min_top_level_entries = val;
    return *this;
}

Tocsplit& Tocsplit::numbering(const NumberingStyle style) {
    impl_->numberingStyle = style;
    return *this;
}

void Tocsplit::setObserver(TocsplitObserver* observer) {
    impl_->observer.store(observer);

    // inject bridge sink once an observer is present
    if (observer && impl_->bridgeSink == 0) {
        impl_->bridgeSink = Logger::add_sink(std::make_unique<BridgeLogSink>(impl_->observer));
    } else if (!observer && impl_->bridgeSink != 0) {
        Logger::remove_sink(impl_->bridgeSink);
        impl_->bridgeSink = 0;
    }
}

TocTree Tocsplit::extract_toc(const fs::path& document) const {
    const DocumentHandle handle = DocumentHandle::open(document);
    return impl_->extract(handle);
}

TocTree Tocsplit::extract_toc(std::vector<unsigned char> bytes, const std::string& name) const {
    const DocumentHandle handle = DocumentHandle::open(std::move(bytes), name);
    return impl_->extract(handle);
}

void Tocsplit::save_toc(const fs::path& document, TocTree tree) {
    std::lock_guard lock(impl_->mtx);
    impl_->savedTocs[Impl::documentKey(document)] = std::move(tree);
}

std::optional<TocTree> Tocsplit::saved_toc(const fs::path& document) const {
    std::lock_guard lock(impl_->mtx);
    const auto it = impl_->savedTocs.find(Impl::documentKey(document));
    if (it == impl_->savedTocs.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Tocsplit::discard_saved_toc(const fs::path& document) {
    std::lock_guard lock(impl_->mtx);
    return impl_->savedTocs.erase(Impl::documentKey(document)) > 0;
}

DocumentInfo Tocsplit::document_info(const fs::path& document) const {
    const DocumentHandle handle = DocumentHandle::open(document);
    return handle.info();
}

std::string Tocsplit::submit_split(const fs::path& document, const std::optional<TocTree>& toc) {
    return impl_->submit(DocumentHandle::open(document), document, toc);
}

std::string Tocsplit::submit_split(std::vector<unsigned char> bytes,
                                   const std::string& name,
                                   const std::optional<TocTree>& toc) {
    return impl_->submit(DocumentHandle::open(std::move(bytes), name), {}, toc);
}

SplitJob Tocsplit::poll_job(const std::string& job_id) const {
    const auto* engine = impl_->currentEngine();
    if (!engine) {
        throw JobNotFound(job_id);
    }
    return engine->get_status(job_id);
}

fs::path Tocsplit::fetch_output(const std::string& job_id) const {
    const auto* engine = impl_->currentEngine();
    if (!engine) {
        throw JobNotFound(job_id);
    }
    return engine->get_output(job_id);
}

std::vector<std::string> Tocsplit::job_ids() const {
    return impl_->jobStore.ids();
}

void Tocsplit::wait_idle() {
    if (auto* engine = impl_->currentEngine()) {
        engine->wait_idle();
    }
}

} // namespace tocsplit
