#pragma once

#include "BuildLog.hpp"
#include "IFileSystem.hpp"
#include "core/CodeFenceScanner.hpp"
#include "core/Node.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hframe {

using json = nlohmann::json;

/**
 * @brief Effective root and the nodes to build beneath it
 */
struct BuildPlan {
    std::filesystem::path root;
    std::vector<const Node*> nodes;
    bool promoted = false;  // true when a single tree root names the project folder
};

/**
 * @brief Paths touched by a build
 */
struct BuildStats {
    std::set<std::filesystem::path> dirs_created;
    std::set<std::filesystem::path> files_created;
    std::set<std::filesystem::path> skipped;
    std::size_t fences_processed = 0;
    std::size_t fences_failed = 0;

    /**
     * @brief Counts as JSON: {dirs, files, skipped, fences_processed, fences_failed}
     */
    json to_json() const;
};

/**
 * @brief Structural build failure, carries the statistics gathered so far
 */
class BuildError : public std::runtime_error {
public:
    BuildError(const std::string& message, BuildStats partial)
        : std::runtime_error(message), stats_(std::move(partial)) {}

    const BuildStats& stats() const { return stats_; }

private:
    BuildStats stats_;
};

/**
 * @brief Error mapping one fence to a target file
 */
class FenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Creates the node forest on a file system and fills files from fences
 *
 * The structural pass creates directories and files in document order and
 * never overwrites: existing paths are recorded as skipped. Any failure in
 * this pass aborts the build with BuildError. The content pass then maps
 * each fence to a file (exact relative path, then bare filename, else a new
 * path under the root) and writes it following the conflict policy:
 * missing file is created, an empty or comment-only file is appended to,
 * and a file with other content is left alone while the fence is written
 * to "name (N).ext". Fence failures are logged and do not stop the build.
 */
class TreeBuilder {
public:
    /**
     * @brief Construct builder with its collaborators
     * @param fs File system to build on
     * @param log Build log receiving progress and errors
     * @throws std::invalid_argument if a collaborator is null
     */
    TreeBuilder(std::shared_ptr<IFileSystem> fs, std::shared_ptr<BuildLog> log);

    /**
     * @brief Choose the effective root for a forest
     *
     * Several roots are built directly under base_dir. A single root is
     * promoted: the effective root becomes base_dir/<root> and only its
     * children are built.
     */
    static BuildPlan plan(const Forest& forest, const std::filesystem::path& base_dir);

    /**
     * @brief Build the plan and apply the fences
     * @return Statistics for this build
     * @throws BuildError on a structural failure
     */
    BuildStats build(const BuildPlan& plan, const std::vector<Fence>& fences);

    /**
     * @brief First free "stem (N)ext" sibling of path
     */
    static std::filesystem::path duplicate_path(const IFileSystem& fs,
                                                const std::filesystem::path& path);

    /**
     * @brief Normalize a fence filename into a safe relative path
     *
     * Separators are unified, empty and "." segments dropped, each segment
     * sanitized.
     * @throws FenceError for absolute paths, ".." segments or empty results
     */
    static std::filesystem::path normalize_fence_path(const std::string& filename);

private:
    struct KnownNode {
        std::filesystem::path path;
        const Node* node;
    };

    void build_root(const BuildPlan& plan, bool& build_children);
    void build_node(const Node& node, const std::filesystem::path& parent_path);
    void ensure_directory(const std::filesystem::path& dir);

    void fill_from_fences(const std::vector<Fence>& fences);
    KnownNode resolve_target(const Fence& fence) const;
    void write_fence(const KnownNode& target, const Fence& fence);
    std::optional<std::string> comment_line(const KnownNode& target) const;

    std::shared_ptr<IFileSystem> fs_;
    std::shared_ptr<BuildLog> log_;

    std::filesystem::path root_;
    BuildStats stats_;
    std::vector<KnownNode> known_nodes_;               // document order
    std::map<std::filesystem::path, std::size_t> path_index_;
};

} // namespace hframe
