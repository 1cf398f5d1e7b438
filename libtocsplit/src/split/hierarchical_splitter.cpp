#include "hierarchical_splitter.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "logger.hpp"
#include <system_error>

namespace tocsplit {

namespace fs = std::filesystem;

namespace {
constexpr const char* kTag = "Splitter";
}

struct HierarchicalSplitter::Run {
    const DocumentHandle& handle;
    fs::path root;
    const ProgressCallback& progress;
    const SectionCallback& on_section;
    std::size_t total_files = 0;
    std::size_t files_written = 0;
    std::vector<SplitOutput> outputs;
};

std::string HierarchicalSplitter::entry_stem(const std::string& index_path, const std::string& title) {
    return index_path + "_" + sanitize_title(title);
}

std::vector<SplitOutput> HierarchicalSplitter::split(const DocumentHandle& handle,
                                                     const TocTree& resolved_tree,
                                                     const fs::path& output_root,
                                                     const ProgressCallback& progress,
                                                     const SectionCallback& on_section) const {
    Run run{handle, output_root, progress, on_section};
    run.total_files = count_nodes(resolved_tree);

    std::error_code ec;
    fs::create_directories(output_root, ec);
    if (ec) {
        throw SplitFailure("-", output_root.filename().string(),
                           "cannot create output directory " + output_root.string() + ": " + ec.message());
    }

    Logger::log(LogLevel::Info, "Splitting " + handle.source_name() + " into " +
                std::to_string(run.total_files) + " files under " + output_root.string(), kTag);

    split_nodes(run, resolved_tree.chapters, output_root, "", 0);
    return std::move(run.outputs);
}

void HierarchicalSplitter::split_nodes(Run& run,
                                       const std::vector<TocNode>& nodes,
                                       const fs::path& dir,
                                       const std::string& parent_index,
                                       const std::size_t depth) const {
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const TocNode& node = nodes[i];
        const std::string index = parent_index.empty()
            ? std::to_string(i + 1)
            : parent_index + "." + std::to_string(i + 1);
        const std::string stem = entry_stem(index, node.title);

        if (node.is_leaf()) {
            write_node(run, node, dir / (stem + ".pdf"), false, depth);
            continue;
        }

        const fs::path node_dir = dir / stem;
        std::error_code ec;
        fs::create_directories(node_dir, ec);
        if (ec) {
            throw SplitFailure(node.number, node.title,
                               "cannot create directory " + node_dir.string() + ": " + ec.message());
        }
        write_node(run, node, node_dir / (stem + ".pdf"), true, depth);
        split_nodes(run, node.children, node_dir, index, depth + 1);
    }
}

void HierarchicalSplitter::write_node(Run& run,
                                      const TocNode& node,
                                      const fs::path& file,
                                      const bool whole_chapter,
                                      const std::size_t depth) const {
    if (!node.end_page) {
        throw SplitFailure(node.number, node.title, "end page is unresolved");
    }

    try {
        write_file(file, run.handle.extract_pages(node.start_page, *node.end_page));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Error saving '" + node.title + "' to " + file.string() + ": " + e.what(), kTag);
        throw SplitFailure(node.number, node.title, e.what());
    }

    SplitOutput output;
    output.relative_path = file.lexically_relative(run.root);
    output.number = node.number;
    output.title = node.title;
    output.start_page = node.start_page;
    output.end_page = *node.end_page;
    output.whole_chapter = whole_chapter;
    output.depth = depth;

    ++run.files_written;
    Logger::log(LogLevel::Debug, "Saved: " + output.relative_path.generic_string() + " (pages " +
                std::to_string(output.start_page) + " to " + std::to_string(output.end_page) + ")", kTag);

    if (run.on_section) {
        run.on_section(output, file);
    }
    run.outputs.push_back(std::move(output));

    if (run.progress && run.total_files > 0) {
        run.progress(static_cast<int>(100 * run.files_written / run.total_files));
    }
}

} // namespace tocsplit
