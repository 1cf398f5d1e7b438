#include "toc_json.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "logger.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace tocsplit {

using nlohmann::json;

namespace {

json node_to_json(const TocNode& node) {
    json j;
    j["title"] = node.title;
    j["number"] = node.number;
    j["page"] = node.start_page;
    if (node.end_page) {
        j["end_page"] = *node.end_page;
    }
    j["subtopics"] = json::array();
    for (const auto& child : node.children) {
        j["subtopics"].push_back(node_to_json(child));
    }
    return j;
}

int page_value(const json& j, const char* key, const std::string& where) {
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw TocFormatError(where + ": \"" + key + "\" must be an integer");
    }
    const auto page = value.get<long long>();
    if (page < 1 || page > 1'000'000'000LL) {
        throw TocFormatError(where + ": \"" + key + "\" must be a positive page number, got " + std::to_string(page));
    }
    return static_cast<int>(page);
}

TocNode node_from_json(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw TocFormatError(where + ": expected an object");
    }

    TocNode node;
    if (!j.contains("title") || !j["title"].is_string()) {
        throw TocFormatError(where + ": \"title\" must be a string");
    }
    node.title = j["title"].get<std::string>();

    if (j.contains("number") && !j["number"].is_null()) {
        const auto& number = j["number"];
        if (number.is_string()) {
            node.number = number.get<std::string>();
        } else if (number.is_number_integer()) {
            node.number = std::to_string(number.get<long long>());
        } else {
            throw TocFormatError(where + ": \"number\" must be a string");
        }
    }

    if (!j.contains("page")) {
        throw TocFormatError(where + ": missing \"page\"");
    }
    node.start_page = page_value(j, "page", where);

    if (j.contains("end_page") && !j["end_page"].is_null()) {
        node.end_page = page_value(j, "end_page", where);
        if (*node.end_page < node.start_page) {
            throw TocFormatError(where + ": \"end_page\" " + std::to_string(*node.end_page) +
                                 " is before \"page\" " + std::to_string(node.start_page));
        }
    }

    if (j.contains("subtopics") && !j["subtopics"].is_null()) {
        const auto& subtopics = j["subtopics"];
        if (!subtopics.is_array()) {
            throw TocFormatError(where + ": \"subtopics\" must be an array");
        }
        for (std::size_t i = 0; i < subtopics.size(); ++i) {
            node.children.push_back(node_from_json(subtopics[i], where + ".subtopics[" + std::to_string(i) + "]"));
        }
    }
    return node;
}

void shift_pages(std::vector<TocNode>& nodes, const int offset) {
    for (auto& node : nodes) {
        node.start_page += offset;
        if (node.end_page) {
            *node.end_page += offset;
        }
        shift_pages(node.children, offset);
    }
}

} // namespace

json toc_to_json(const TocTree& tree) {
    json j;
    j["chapters"] = json::array();
    for (const auto& chapter : tree.chapters) {
        j["chapters"].push_back(node_to_json(chapter));
    }
    if (tree.content_start_page != 1) {
        j["content_start_page"] = tree.content_start_page;
    }
    return j;
}

TocTree toc_from_json(const json& j) {
    if (!j.is_object()) {
        throw TocFormatError("TOC document must be a JSON object");
    }
    // tolerate the {"toc": {...}} envelope returned by the extraction endpoint
    if (!j.contains("chapters") && j.contains("toc") && j["toc"].is_object()) {
        return toc_from_json(j["toc"]);
    }
    if (!j.contains("chapters") || !j["chapters"].is_array()) {
        throw TocFormatError("TOC document needs a \"chapters\" array");
    }

    TocTree tree;
    const auto& chapters = j["chapters"];
    for (std::size_t i = 0; i < chapters.size(); ++i) {
        tree.chapters.push_back(node_from_json(chapters[i], "chapters[" + std::to_string(i) + "]"));
    }
    if (j.contains("content_start_page") && !j["content_start_page"].is_null()) {
        tree.content_start_page = page_value(j, "content_start_page", "TOC");
    }
    fill_missing_numbers(tree);
    return tree;
}

TocTree load_toc_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw TocFormatError("cannot open TOC file " + path.string());
    }
    try {
        return toc_from_json(json::parse(in));
    } catch (const json::exception& e) {
        throw TocFormatError("invalid TOC JSON in " + path.filename().string() + ": " + e.what());
    }
}

void save_toc_file(const TocTree& tree, const std::filesystem::path& path) {
    const std::string text = toc_to_json(tree).dump(2) + "\n";
    write_file(path, std::vector<unsigned char>(text.begin(), text.end()));
    Logger::log(LogLevel::Debug, "Wrote TOC to " + path.string(), "toc_json");
}

TocTree to_absolute_pages(const TocTree& tree) {
    TocTree absolute = tree;
    if (tree.content_start_page != 1) {
        shift_pages(absolute.chapters, tree.content_start_page - 1);
        absolute.content_start_page = 1;
    }
    return absolute;
}

} // namespace tocsplit
