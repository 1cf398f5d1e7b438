#include "file_utils.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace tocsplit {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);
        return _wfopen(path.wstring().c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    void write_file(const std::filesystem::path& path, const std::vector<unsigned char>& data) {
        FILE* f = open_file(path, "wb");
        if (!f) {
            throw std::runtime_error("cannot create " + path.string() + ": " + std::strerror(errno));
        }
        const std::size_t written = data.empty() ? 0 : std::fwrite(data.data(), 1, data.size(), f);
        const bool short_write = written != data.size();
        if (std::fclose(f) != 0 || short_write) {
            throw std::runtime_error("write error on " + path.string());
        }
    }

    std::string sanitize_title(const std::string_view title, const std::size_t max_bytes) {
        static constexpr std::string_view kIllegal = "<>:\"/\\|?*";

        std::string out;
        out.reserve(title.size());
        bool in_space = false;
        for (const char ch : title) {
            const auto c = static_cast<unsigned char>(ch);
            // dropped characters do not end a whitespace run
            if (kIllegal.find(ch) != std::string_view::npos) continue;
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
                if (!in_space) out.push_back('_');
                in_space = true;
                continue;
            }
            if (c < 0x20 || c == 0x7F) continue;
            in_space = false;
            out.push_back(ch);
        }

        auto trimmable = [](const char c) { return c == '.' || c == '_' || c == ' '; };
        std::size_t begin = 0;
        while (begin < out.size() && trimmable(out[begin])) ++begin;
        std::size_t end = out.size();
        while (end > begin && trimmable(out[end - 1])) --end;
        out = out.substr(begin, end - begin);

        if (out.size() > max_bytes) {
            std::size_t cut = max_bytes;
            // back off continuation bytes so no UTF-8 sequence is split
            while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) --cut;
            out.resize(cut);
            while (!out.empty() && trimmable(out.back())) out.pop_back();
        }

        if (out.empty()) {
            return "untitled";
        }
        return out;
    }

} // namespace tocsplit
