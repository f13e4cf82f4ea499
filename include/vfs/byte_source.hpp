//! # Class-Loading View
//!
//! A `ByteSource` lets a host runtime load freshly written binaries
//! straight from a workspace group. Names are resolved against the live
//! containers on every call, so files written after the view was obtained
//! are visible.

#pragma once

#include "common.hpp"

#include <string_view>

namespace jig::vfs {

class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Bytes of the class with binary name `binary_name` ("com.example.Foo"),
    /// read from "com/example/Foo.class".
    virtual std::optional<Bytes> fetch(std::string_view binary_name) const = 0;

    /// Bytes of the resource at the root-relative `path`.
    virtual std::optional<Bytes> fetch_resource(std::string_view path) const = 0;

    bool can_load(std::string_view binary_name) const {
        return fetch(binary_name).has_value();
    }
};

} // namespace jig::vfs
