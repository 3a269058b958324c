#include "TreeBuilder.hpp"
#include "core/CommentFormatter.hpp"
#include "core/NameSanitizer.hpp"
#include "core/TextUtils.hpp"
#include <spdlog/spdlog.h>
#include <cctype>

namespace hframe {

json BuildStats::to_json() const {
    return {
        {"dirs", dirs_created.size()},
        {"files", files_created.size()},
        {"skipped", skipped.size()},
        {"fences_processed", fences_processed},
        {"fences_failed", fences_failed}
    };
}

TreeBuilder::TreeBuilder(std::shared_ptr<IFileSystem> fs, std::shared_ptr<BuildLog> log)
    : fs_(std::move(fs)), log_(std::move(log)) {
    if (!fs_) {
        throw std::invalid_argument("File system cannot be null");
    }
    if (!log_) {
        throw std::invalid_argument("Build log cannot be null");
    }
}

BuildPlan TreeBuilder::plan(const Forest& forest, const std::filesystem::path& base_dir) {
    BuildPlan plan;

    if (forest.size() == 1) {
        const Node& root = *forest.front();
        plan.root = base_dir / root.name();
        plan.promoted = true;
        for (const auto& child : root.children()) {
            plan.nodes.push_back(child.get());
        }
        return plan;
    }

    plan.root = base_dir;
    for (const auto& root : forest) {
        plan.nodes.push_back(root.get());
    }
    return plan;
}

std::filesystem::path TreeBuilder::normalize_fence_path(const std::string& filename) {
    std::string_view name = TextUtils::trim(filename);

    bool drive_letter = name.size() >= 2 &&
                        std::isalpha(static_cast<unsigned char>(name[0])) && name[1] == ':';
    if (name.empty() || name.front() == '/' || name.front() == '\\' || drive_letter) {
        throw FenceError("Fence path must be relative: '" + filename + "'");
    }

    std::filesystem::path relative;
    std::size_t begin = 0;
    for (std::size_t i = 0; i <= name.size(); ++i) {
        if (i < name.size() && name[i] != '/' && name[i] != '\\') {
            continue;
        }

        std::string_view raw = name.substr(begin, i - begin);
        begin = i + 1;

        if (raw.empty() || raw == ".") {
            continue;
        }
        if (raw == "..") {
            throw FenceError("Fence path may not leave the build root: '" + filename + "'");
        }

        std::string segment = NameSanitizer::sanitize(raw);
        if (!segment.empty()) {
            relative /= segment;
        }
    }

    if (relative.empty()) {
        throw FenceError("Fence filename has no usable segments: '" + filename + "'");
    }
    return relative;
}

std::filesystem::path TreeBuilder::duplicate_path(const IFileSystem& fs,
                                                  const std::filesystem::path& path) {
    auto directory = path.parent_path();
    auto stem = path.stem().string();
    auto extension = path.extension().string();

    for (std::size_t counter = 1;; ++counter) {
        auto candidate = directory / fmt::format("{} ({}){}", stem, counter, extension);
        if (!fs.exists(candidate)) {
            return candidate;
        }
    }
}

BuildStats TreeBuilder::build(const BuildPlan& plan, const std::vector<Fence>& fences) {
    root_ = plan.root;
    stats_ = BuildStats{};
    known_nodes_.clear();
    path_index_.clear();

    log_->section("Building File Structure");
    log_->info(fmt::format("Processing {} node(s)", plan.nodes.size()),
               fmt::format("Root: {}", root_.string()));

    try {
        bool build_children = true;
        build_root(plan, build_children);

        if (build_children) {
            for (const Node* node : plan.nodes) {
                build_node(*node, root_);
            }
        }
    } catch (const std::exception& e) {
        log_->error("Build failed", e.what());
        throw BuildError(e.what(), stats_);
    }

    log_->info(fmt::format("Created {} directories", stats_.dirs_created.size()));
    log_->info(fmt::format("Created {} files", stats_.files_created.size()));
    log_->info(fmt::format("Skipped {} existing items", stats_.skipped.size()));

    if (!fences.empty()) {
        log_->section("Filling Content from Code Fences");
        fill_from_fences(fences);
    }

    return stats_;
}

void TreeBuilder::build_root(const BuildPlan& plan, bool& build_children) {
    if (fs_->exists(root_)) {
        if (!fs_->is_directory(root_)) {
            stats_.skipped.insert(root_);
            log_->warning("Root exists but is not a directory: " + root_.string(),
                          "Tree structure not built");
            build_children = false;
            return;
        }
        if (plan.promoted) {
            stats_.skipped.insert(root_);
            log_->info("Using existing root directory: " + root_.string());
        }
        return;
    }

    if (plan.nodes.empty()) {
        log_->info("Nothing to build under " + root_.string());
        return;
    }

    ensure_directory(root_);
}

void TreeBuilder::ensure_directory(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return;
    }

    if (fs_->exists(dir)) {
        if (!fs_->is_directory(dir)) {
            throw FileSystemError("Path exists but is not a directory", dir);
        }
        return;
    }

    auto parent = dir.parent_path();
    if (parent != dir) {
        ensure_directory(parent);
    }

    fs_->make_directories(dir);
    stats_.dirs_created.insert(dir);
    log_->info("Created directory: " + dir.string());
}

void TreeBuilder::build_node(const Node& node, const std::filesystem::path& parent_path) {
    auto full_path = parent_path / node.name();

    if (path_index_.find(full_path) == path_index_.end()) {
        path_index_[full_path] = known_nodes_.size();
        known_nodes_.push_back({full_path, &node});
    }

    if (node.is_leaf()) {
        if (fs_->exists(full_path)) {
            if (stats_.files_created.count(full_path) == 0) {
                stats_.skipped.insert(full_path);
            }
            log_->info("Skipped existing file: " + full_path.string());
            return;
        }

        ensure_directory(parent_path);

        std::string content;
        if (node.comment()) {
            content = CommentFormatter::format(full_path, *node.comment()) + "\n";
        }
        fs_->write_file(full_path, content, WriteMode::OVERWRITE);
        stats_.files_created.insert(full_path);

        if (node.comment()) {
            log_->info("Created file: " + full_path.string(), "With comment: " + *node.comment());
        } else {
            log_->info("Created file: " + full_path.string());
        }
        return;
    }

    if (fs_->exists(full_path)) {
        if (!fs_->is_directory(full_path)) {
            stats_.skipped.insert(full_path);
            log_->warning("Path exists but is not a directory: " + full_path.string(),
                          "Children not built");
            return;
        }
        if (stats_.dirs_created.count(full_path) == 0) {
            stats_.skipped.insert(full_path);
            log_->info("Using existing directory: " + full_path.string());
        }
    } else {
        fs_->make_directories(full_path);
        stats_.dirs_created.insert(full_path);
        log_->info("Created directory: " + full_path.string());
    }

    for (const auto& child : node.children()) {
        build_node(*child, full_path);
    }
}

void TreeBuilder::fill_from_fences(const std::vector<Fence>& fences) {
    log_->info(fmt::format("Processing {} code fences", fences.size()));

    for (const auto& fence : fences) {
        try {
            log_->info("Processing fence: " + fence.filename,
                       fmt::format("From line {}, {} chars", fence.line_number, fence.content.size()));

            KnownNode target = resolve_target(fence);
            write_fence(target, fence);
            ++stats_.fences_processed;
        } catch (const std::exception& e) {
            ++stats_.fences_failed;
            log_->error("Failed to process fence: " + fence.filename,
                        fmt::format("Line {}: {}", fence.line_number, e.what()));
        }
    }
}

TreeBuilder::KnownNode TreeBuilder::resolve_target(const Fence& fence) const {
    auto relative = normalize_fence_path(fence.filename);
    bool has_separator = fence.filename.find_first_of("/\\") != std::string::npos;

    if (has_separator) {
        auto it = path_index_.find(root_ / relative);
        if (it != path_index_.end()) {
            const KnownNode& known = known_nodes_[it->second];
            if (!known.node->is_leaf()) {
                throw FenceError("Fence target is a directory: " + known.path.string());
            }
            log_->info("Matched to tree path: " + known.path.string());
            return known;
        }
    } else {
        // Bare filename: first file node in document order wins
        std::string name = relative.string();
        for (const auto& known : known_nodes_) {
            if (known.node->is_leaf() && known.node->name() == name) {
                log_->info("Matched to tree path: " + known.path.string());
                return known;
            }
        }
    }

    log_->info("Not in tree, creating as shorthand: " + relative.generic_string());
    return {root_ / relative, nullptr};
}

std::optional<std::string> TreeBuilder::comment_line(const KnownNode& target) const {
    if (target.node && target.node->comment()) {
        return CommentFormatter::format(target.path, *target.node->comment());
    }
    return std::nullopt;
}

void TreeBuilder::write_fence(const KnownNode& target, const Fence& fence) {
    const auto& path = target.path;
    auto header = comment_line(target);

    if (!fs_->exists(path)) {
        ensure_directory(path.parent_path());

        std::string content = header ? *header + "\n" : std::string();
        content += fence.content;
        fs_->write_file(path, content, WriteMode::OVERWRITE);
        stats_.files_created.insert(path);
        log_->info("Created new file with content: " + path.string());
        return;
    }

    if (fs_->is_directory(path)) {
        throw FenceError("Fence target is a directory: " + path.string());
    }

    std::string existing = fs_->read_file(path);
    std::string_view trimmed = TextUtils::trim(existing);
    bool comment_only = header && trimmed == TextUtils::trim(*header);

    if (trimmed.empty() || comment_only) {
        std::string payload;
        if (!existing.empty() && existing.back() != '\n') {
            payload += '\n';
        }
        payload += fence.content;
        fs_->write_file(path, payload, WriteMode::APPEND);
        log_->info("Appended content to: " + path.string());
        return;
    }

    auto duplicate = duplicate_path(*fs_, path);
    fs_->write_file(duplicate, fence.content, WriteMode::OVERWRITE);
    stats_.files_created.insert(duplicate);
    log_->warning("File had content, created duplicate: " + duplicate.string());
}

} // namespace hframe
