//! # Common Definitions
//!
//! Types shared by every jig module.
//!
//! ## Overview
//!
//! - **Result Type**: Error values for internal parsing steps
//! - **Byte Buffers**: The byte vector used for file contents
//! - **Smart Pointers**: Owning pointer alias used for containers
//!
//! Public lookups return `std::optional`. Misuse and backing-store failures
//! throw (see `vfs/errors.hpp`). `Result<T, E>` is used inside parsers whose
//! failures are converted into exceptions at the API edge.

#ifndef JIG_COMMON_HPP
#define JIG_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jig {

// ============================================================================
// Byte Buffers
// ============================================================================

/// Raw file contents.
using Bytes = std::vector<uint8_t>;

/// Copies a string into a byte buffer.
inline auto to_bytes(std::string_view text) -> Bytes {
    return Bytes(text.begin(), text.end());
}

/// Interprets a byte buffer as text (no decoding is performed).
inline auto to_string(const Bytes& bytes) -> std::string {
    return std::string(bytes.begin(), bytes.end());
}

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<CentralDirectory, std::string> read_directory(std::istream& in);
///
/// auto result = read_directory(in);
/// if (is_err(result)) {
///     throw BackingStoreError(...unwrap_err(result)...);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace jig

#endif // JIG_COMMON_HPP
