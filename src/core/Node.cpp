#include "core/Node.hpp"
#include <stdexcept>

namespace hframe {

Node::Node(std::string name, bool is_leaf, std::optional<std::string> comment)
    : name_(std::move(name)), is_leaf_(is_leaf), comment_(std::move(comment)) {
}

void Node::backfill_comment(const std::optional<std::string>& comment) {
    if (!comment_ && comment) {
        comment_ = comment;
    }
}

Node& Node::add_child(std::unique_ptr<Node> child) {
    if (!child) {
        throw std::invalid_argument("Child node cannot be null");
    }

    is_leaf_ = false;
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

Node* Node::find_child(std::string_view name) const {
    for (const auto& child : children_) {
        if (child->name_ == name) {
            return child.get();
        }
    }
    return nullptr;
}

std::string Node::path() const {
    if (!parent_) {
        return name_;
    }
    return parent_->path() + "/" + name_;
}

Node* find_root(const Forest& forest, std::string_view name) {
    for (const auto& root : forest) {
        if (root->name() == name) {
            return root.get();
        }
    }
    return nullptr;
}

json to_json(const Node& node) {
    json result = {
        {"name", node.name()},
        {"type", node.is_leaf() ? "file" : "directory"}
    };

    if (node.comment()) {
        result["comment"] = *node.comment();
    }

    if (!node.children().empty()) {
        json children = json::array();
        for (const auto& child : node.children()) {
            children.push_back(to_json(*child));
        }
        result["children"] = children;
    }

    return result;
}

json forest_to_json(const Forest& forest) {
    json roots = json::array();
    for (const auto& root : forest) {
        roots.push_back(to_json(*root));
    }
    return roots;
}

} // namespace hframe
