#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hframe {

using json = nlohmann::json;

/**
 * @brief One file or directory recovered from tree notation
 *
 * Children are owned by their parent; the parent pointer is a non-owning
 * back-reference used only to rebuild paths.
 */
class Node {
public:
    /**
     * @brief Construct a node
     * @param name Sanitized path segment
     * @param is_leaf true for a file, false for a directory
     * @param comment Optional inline annotation from the source line
     */
    explicit Node(std::string name, bool is_leaf = true,
                  std::optional<std::string> comment = std::nullopt);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const std::string& name() const { return name_; }
    bool is_leaf() const { return is_leaf_; }
    const std::optional<std::string>& comment() const { return comment_; }
    Node* parent() const { return parent_; }
    const std::vector<std::unique_ptr<Node>>& children() const { return children_; }

    /**
     * @brief Declare this node a directory (used for explicit trailing separators)
     */
    void mark_directory() { is_leaf_ = false; }

    /**
     * @brief Set the comment only if none was recorded yet
     */
    void backfill_comment(const std::optional<std::string>& comment);

    /**
     * @brief Attach a child and take ownership of it
     *
     * A node that gains a child always becomes a directory.
     * @return Reference to the attached child
     */
    Node& add_child(std::unique_ptr<Node> child);

    /**
     * @brief Find a direct child by name
     * @return Child pointer or nullptr
     */
    Node* find_child(std::string_view name) const;

    /**
     * @brief Path from the nearest root, segments joined with '/'
     */
    std::string path() const;

private:
    std::string name_;
    bool is_leaf_;
    std::optional<std::string> comment_;
    Node* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
};

/**
 * @brief Ordered roots produced by one parse
 */
using Forest = std::vector<std::unique_ptr<Node>>;

/**
 * @brief Find a root by name
 * @return Root pointer or nullptr
 */
Node* find_root(const Forest& forest, std::string_view name);

/**
 * @brief Serialize a node and its subtree
 *
 * Shape: {"name", "type": "file"|"directory", "comment"?, "children"?}
 */
json to_json(const Node& node);

/**
 * @brief Serialize all roots of a forest as a JSON array
 */
json forest_to_json(const Forest& forest);

} // namespace hframe
