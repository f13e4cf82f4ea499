//! # Tree Printer Implementation

#include "vfs/tree_printer.hpp"

#include "vfs/container_group.hpp"
#include "vfs/paths.hpp"

#include <map>
#include <memory>
#include <sstream>

namespace jig::vfs {

namespace {

struct Node {
    std::map<std::string, std::unique_ptr<Node>> children;
    bool is_directory = false;
};

void add_line(std::ostringstream& out, size_t level, std::string_view name, bool is_directory) {
    for (size_t i = 0; i < level; ++i) {
        out << "┃  ";
    }
    out << "┣━━" << (is_directory ? "┓ " : "╸ ") << name << (is_directory ? "/" : "") << "\n";
}

void visit(std::ostringstream& out, const Node& node, size_t level) {
    for (const auto& [name, child] : node.children) {
        add_line(out, level, name, child->is_directory);
        if (child->is_directory) {
            visit(out, *child, level + 1);
        }
    }
}

} // namespace

std::string render_tree(std::string_view root_name, const std::vector<std::string>& relative_paths) {
    Node root;
    root.is_directory = true;

    for (const auto& path : relative_paths) {
        auto segments = split_segments(path);
        Node* node = &root;
        for (size_t i = 0; i < segments.size(); ++i) {
            auto& slot = node->children[segments[i]];
            if (!slot) {
                slot = std::make_unique<Node>();
            }
            if (i + 1 < segments.size()) {
                slot->is_directory = true;
            }
            node = slot.get();
        }
    }

    std::ostringstream out;
    add_line(out, 0, root_name, true);
    visit(out, root, 1);
    return out.str();
}

std::string render_tree(const Container& container) {
    return render_tree(container.name(), container.list_all());
}

std::string render_tree(const ContainerGroup& group) {
    std::ostringstream out;
    for (const auto* container : group.containers()) {
        out << render_tree(*container);
    }
    return out.str();
}

} // namespace jig::vfs
