//! # Call Context Capture
//!
//! Captures who reported a diagnostic: the calling thread's id and name
//! and its call stack.
//!
//! ## Stack Traces
//!
//! Frames are captured with `backtrace()` and resolved with `dladdr()`;
//! C++ symbols are demangled. Symbols of static functions are usually not
//! exported, so those frames show only the module and offset.

#pragma once

#include "diag/diagnostic.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jig::diag {

/// Maximum number of frames captured.
constexpr size_t MAX_STACK_DEPTH = 128;

/// Captures the calling thread's stack, skipping the `skip` innermost
/// frames (this function itself is always skipped).
std::vector<StackFrame> capture_stack_trace(size_t skip = 0, size_t max_depth = 64);

/// One line per frame, each prefixed with "\n\tat ".
std::string format_stack_trace(const std::vector<StackFrame>& frames);

/// Demangles a C++ symbol, returning the input unchanged if it is not mangled.
std::string demangle(const char* symbol);

/// Kernel id of the calling thread.
uint64_t current_thread_id();

/// Name of the calling thread: the name set through
/// `set_current_thread_name`, else the OS thread name.
std::string current_thread_name();

/// Names the calling thread for diagnostics (and the OS, truncated to
/// 15 characters).
void set_current_thread_name(std::string_view name);

} // namespace jig::diag
