#include "mime_detector.hpp"
#include "logger.hpp"
#include <magic.h>

namespace {

// owns a libmagic cookie for the duration of one lookup
class MagicCookie {
public:
    MagicCookie() : cookie_(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR)) {
        if (cookie_ && magic_load(cookie_, nullptr) != 0) {
            Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(cookie_), "MimeDetector");
            magic_close(cookie_);
            cookie_ = nullptr;
        }
    }
    ~MagicCookie() {
        if (cookie_) magic_close(cookie_);
    }
    MagicCookie(const MagicCookie&) = delete;
    MagicCookie& operator=(const MagicCookie&) = delete;

    [[nodiscard]] magic_t get() const noexcept { return cookie_; }

private:
    magic_t cookie_;
};

} // namespace

std::string tocsplit::MimeDetector::detect(const std::filesystem::path& path) {
    const MagicCookie magic;
    if (!magic.get()) return {};
    const char* mime = magic_file(magic.get(), path.string().c_str());
    return mime ? mime : "";
}

std::string tocsplit::MimeDetector::detect(const unsigned char* data, const std::size_t size) {
    if (!data || size == 0) return {};
    const MagicCookie magic;
    if (!magic.get()) return {};
    const char* mime = magic_buffer(magic.get(), data, size);
    return mime ? mime : "";
}

bool tocsplit::MimeDetector::is_definitely_not_pdf(const std::string& mime) {
    if (mime.empty() || mime == "application/octet-stream") return false;
    return mime != "application/pdf" && mime != "application/x-pdf";
}
