#include "document_handle.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "mime_detector.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFOutlineDocumentHelper.hh>
#include <qpdf/QPDFOutlineObjectHelper.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <map>
#include <mutex>
#include <ostream>
#include <sstream>
#include <system_error>

namespace {

constexpr const char* kTag = "DocumentHandle";

// helper: streambuf that forwards qpdf diagnostics to the Logger
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    explicit LoggerStreamBuf(const LogLevel lvl) : level(lvl) {}
    int sync() override {
        std::string s = str();
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        if (!s.empty()) {
            Logger::log(level, "qpdf: " + s, kTag);
        }
        str("");
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

} // namespace

namespace tocsplit {

namespace fs = std::filesystem;

struct DocumentHandle::Impl {
    fs::path path;                    ///< Empty for in-memory documents
    std::vector<unsigned char> bytes; ///< Backing store for processMemoryFile, must outlive pdf
    LoggerStreamBuf info_buf{LogLevel::Debug};
    LoggerStreamBuf warn_buf{LogLevel::Warning};
    std::ostream info_os{&info_buf};
    std::ostream warn_os{&warn_buf};
    std::shared_ptr<QPDFLogger> qlogger;
    std::unique_ptr<QPDF> pdf;
    std::vector<QPDFPageObjectHelper> pages;
    std::mutex mtx;

    Impl() : qlogger(QPDFLogger::create()) {
        qlogger->setOutputStreams(&info_os, &warn_os);
    }

    [[nodiscard]] std::unique_ptr<QPDF> new_qpdf() const {
        auto q = std::make_unique<QPDF>();
        q->setLogger(qlogger);
        return q;
    }

    void check_range(const int start, const int end) const {
        const int count = static_cast<int>(pages.size());
        if (start < 1 || end < start || end > count) {
            throw InvalidRange("page range [" + std::to_string(start) + ", " + std::to_string(end) +
                               "] is outside [1, " + std::to_string(count) + "]");
        }
    }

    // copies the requested pages (and the objects they reference) into a fresh document
    [[nodiscard]] std::unique_ptr<QPDF> build_subset(const int start, const int end) const {
        auto out = new_qpdf();
        out->emptyPDF();
        QPDFPageDocumentHelper out_pages(*out);
        for (int i = start - 1; i < end; ++i) {
            out_pages.addPage(pages[static_cast<std::size_t>(i)], false);
        }
        return out;
    }
};

DocumentHandle::DocumentHandle(std::unique_ptr<Impl> impl, std::string source_name)
    : impl_(std::move(impl)), source_name_(std::move(source_name)) {}

DocumentHandle::DocumentHandle(DocumentHandle&&) noexcept = default;

DocumentHandle& DocumentHandle::operator=(DocumentHandle&& other) noexcept {
    if (this != &other) {
        close();
        impl_ = std::move(other.impl_);
        source_name_ = std::move(other.source_name_);
    }
    return *this;
}

DocumentHandle::~DocumentHandle() {
    close();
}

DocumentHandle DocumentHandle::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        Logger::log(LogLevel::Error, "PDF file not found: " + path.string(), kTag);
        throw DocumentNotFound("PDF file not found: " + path.string());
    }

    const std::string mime = MimeDetector::detect(path);
    if (MimeDetector::is_definitely_not_pdf(mime)) {
        Logger::log(LogLevel::Error, path.string() + " is " + mime + ", not a PDF", kTag);
        throw CorruptDocument(path.filename().string() + " is not a PDF document (detected " + mime + ")");
    }

    auto impl = std::make_unique<Impl>();
    impl->path = path;
    impl->pdf = impl->new_qpdf();
    try {
        impl->pdf->processFile(path.string().c_str());
        impl->pages = QPDFPageDocumentHelper(*impl->pdf).getAllPages();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Invalid or corrupted PDF " + path.string() + ": " + e.what(), kTag);
        throw CorruptDocument(std::string("cannot parse ") + path.filename().string() + ": " + e.what());
    }
    if (impl->pages.empty()) {
        throw CorruptDocument(path.filename().string() + " has no pages");
    }

    Logger::log(LogLevel::Info, "Loaded PDF: " + path.filename().string() +
                " (" + std::to_string(impl->pages.size()) + " pages)", kTag);
    return DocumentHandle(std::move(impl), path.filename().string());
}

DocumentHandle DocumentHandle::open(std::vector<unsigned char> bytes, std::string name) {
    const std::string mime = MimeDetector::detect(bytes.data(), bytes.size());
    if (bytes.empty() || MimeDetector::is_definitely_not_pdf(mime)) {
        Logger::log(LogLevel::Error, name + " is " + (mime.empty() ? "empty" : mime) + ", not a PDF", kTag);
        throw CorruptDocument(name + " is not a PDF document");
    }

    auto impl = std::make_unique<Impl>();
    impl->bytes = std::move(bytes);
    impl->pdf = impl->new_qpdf();
    try {
        impl->pdf->processMemoryFile(name.c_str(),
                                     reinterpret_cast<const char*>(impl->bytes.data()),
                                     impl->bytes.size());
        impl->pages = QPDFPageDocumentHelper(*impl->pdf).getAllPages();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Invalid or corrupted PDF " + name + ": " + e.what(), kTag);
        throw CorruptDocument("cannot parse " + name + ": " + e.what());
    }
    if (impl->pages.empty()) {
        throw CorruptDocument(name + " has no pages");
    }

    Logger::log(LogLevel::Info, "Loaded PDF from memory: " + name +
                " (" + std::to_string(impl->pages.size()) + " pages)", kTag);
    return DocumentHandle(std::move(impl), std::move(name));
}

DocumentHandle::Impl& DocumentHandle::checked_impl() const {
    if (!impl_ || !impl_->pdf) {
        throw DocumentClosed();
    }
    return *impl_;
}

int DocumentHandle::page_count() const {
    Impl& impl = checked_impl();
    std::lock_guard lock(impl.mtx);
    return static_cast<int>(impl.pages.size());
}

std::vector<unsigned char> DocumentHandle::extract_pages(const int start, const int end) const {
    Impl& impl = checked_impl();
    std::lock_guard lock(impl.mtx);
    impl.check_range(start, end);

    const auto out = impl.build_subset(start, end);
    QPDFWriter writer(*out);
    writer.setOutputMemory();
    writer.write();
    const std::unique_ptr<Buffer> buffer(writer.getBuffer());
    const unsigned char* data = buffer->getBuffer();
    return {data, data + buffer->getSize()};
}

void DocumentHandle::write_pages(const int start, const int end, const fs::path& out_path) const {
    Impl& impl = checked_impl();
    std::lock_guard lock(impl.mtx);
    impl.check_range(start, end);

    const auto out = impl.build_subset(start, end);
    QPDFWriter writer(*out, out_path.string().c_str());
    writer.write();
}

std::vector<OutlineEntry> DocumentHandle::read_outline() const {
    Impl& impl = checked_impl();
    std::lock_guard lock(impl.mtx);

    std::vector<OutlineEntry> entries;
    try {
        QPDFOutlineDocumentHelper outlines(*impl.pdf);
        if (!outlines.hasOutlines()) {
            return {};
        }

        std::map<QPDFObjGen, int> page_numbers;
        for (std::size_t i = 0; i < impl.pages.size(); ++i) {
            page_numbers[impl.pages[i].getObjectHandle().getObjGen()] = static_cast<int>(i) + 1;
        }

        int last_page = 1;

        auto walk = [&](auto&& self, std::vector<QPDFOutlineObjectHelper> items, const int level) -> void {
            for (auto& item : items) {
                OutlineEntry entry;
                entry.title = item.getTitle();
                entry.level = level;
                entry.target_page = last_page;

                QPDFObjectHandle dest = item.getDestPage();
                if (!dest.isNull()) {
                    if (auto it = page_numbers.find(dest.getObjGen()); it != page_numbers.end()) {
                        entry.target_page = it->second;
                    }
                } else {
                    Logger::log(LogLevel::Debug, "Bookmark '" + entry.title +
                                "' has no page destination, using page " + std::to_string(last_page), kTag);
                }
                last_page = entry.target_page;
                entries.push_back(std::move(entry));
                self(self, item.getKids(), level + 1);
            }
        };
        walk(walk, outlines.getTopLevelOutlines(), 0);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Damaged outline in " + source_name_ + ": " + e.what(), kTag);
        throw CorruptDocument("cannot read outline of " + source_name_ + ": " + e.what());
    }

    Logger::log(LogLevel::Debug, "Read " + std::to_string(entries.size()) + " bookmarks from " + source_name_, kTag);
    return entries;
}

DocumentInfo DocumentHandle::info() const {
    Impl& impl = checked_impl();
    std::lock_guard lock(impl.mtx);

    DocumentInfo info;
    info.source_name = source_name_;
    info.page_count = static_cast<int>(impl.pages.size());
    info.encrypted = impl.pdf->isEncrypted();
    info.permissions.print = impl.pdf->allowPrintHighRes();
    info.permissions.copy = impl.pdf->allowExtractAll();
    info.permissions.modify = impl.pdf->allowModifyAll();
    info.permissions.annotate = impl.pdf->allowModifyAnnotation();
    info.pdf_version = impl.pdf->getPDFVersion();
    if (!impl.path.empty()) {
        std::error_code ec;
        const auto size = fs::file_size(impl.path, ec);
        info.file_size = ec ? 0 : size;
    } else {
        info.file_size = impl.bytes.size();
    }

    QPDFObjectHandle dict = impl.pdf->getTrailer().getKey("/Info");
    auto text = [&dict](const char* key) -> std::string {
        if (!dict.isDictionary() || !dict.hasKey(key)) return {};
        QPDFObjectHandle value = dict.getKey(key);
        return value.isString() ? value.getUTF8Value() : std::string();
    };
    info.title = text("/Title");
    info.author = text("/Author");
    info.subject = text("/Subject");
    info.keywords = text("/Keywords");
    info.creator = text("/Creator");
    info.producer = text("/Producer");
    info.creation_date = text("/CreationDate");
    info.modification_date = text("/ModDate");
    return info;
}

bool DocumentHandle::is_open() const noexcept {
    return impl_ && impl_->pdf;
}

void DocumentHandle::close() noexcept {
    if (!impl_) {
        return;
    }
    std::lock_guard lock(impl_->mtx);
    if (impl_->pdf) {
        impl_->pages.clear();
        impl_->pdf.reset();
        impl_->bytes.clear();
        impl_->bytes.shrink_to_fit();
        Logger::log(LogLevel::Debug, "Closed " + source_name_, kTag);
    }
}

} // namespace tocsplit
