//! # Tree Printer
//!
//! Draws the contents of a container as a box-drawing tree for failure
//! messages:
//!
//! ```text
//! ┣━━┓ sources/
//! ┃  ┣━━┓ com/
//! ┃  ┃  ┣━━╸ Foo.java
//! ```
//!
//! Entries of a directory are printed in name order.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace jig::vfs {

class Container;
class ContainerGroup;

/// Renders `relative_paths` (normalized file paths) below a root named `root_name`.
std::string render_tree(std::string_view root_name, const std::vector<std::string>& relative_paths);

/// Renders every file of `container`.
std::string render_tree(const Container& container);

/// Renders every container of `group`, one tree per container, in
/// precedence order.
std::string render_tree(const ContainerGroup& group);

} // namespace jig::vfs
