#include "logger.hpp"
#include <algorithm>
#include <cctype>

std::vector<std::pair<Logger::SinkId, std::unique_ptr<ILogSink>>> Logger::sinks_;
Logger::SinkId Logger::next_id_ = 1;
std::mutex Logger::mtx_;

Logger::SinkId Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) {
        return 0;
    }
    std::lock_guard lock(mtx_);
    const SinkId id = next_id_++;
    sinks_.emplace_back(id, std::move(sink));
    return id;
}

bool Logger::remove_sink(const SinkId id) {
    std::lock_guard lock(mtx_);
    const auto it = std::find_if(sinks_.begin(), sinks_.end(),
                                 [id](const auto& entry) { return entry.first == id; });
    if (it == sinks_.end()) {
        return false;
    }
    sinks_.erase(it);
    return true;
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& [id, sink] : sinks_) {
        sink->log(level, msg, tag);
    }
}

LogLevel Logger::string_to_level(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "INFO")
        return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::Warning;
    return LogLevel::Error;
}
