//! # Common Definitions
//!
//! Types and helpers shared by every cstudio component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Text Spans**: Offset/length pairs into a text snapshot
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Owning pointer alias
//!
//! ## Conventions
//!
//! - **No Exceptions**: Fallible operations return `Result<T, E>`
//! - **Immutable Inputs**: Analysis functions never mutate their arguments
//! - **Explicit Ownership**: `Box<T>` for unique ownership of recursive nodes

#ifndef CSTUDIO_COMMON_HPP
#define CSTUDIO_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cstudio {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Text Spans
// ============================================================================

/// A contiguous character range inside a text snapshot or a single line.
struct TextSpan {
    size_t start = 0;  ///< 0-based character offset.
    size_t length = 0; ///< Number of characters covered.

    [[nodiscard]] auto end() const -> size_t {
        return start + length;
    }

    /// Returns true if `offset` lies in `[start, end)`.
    [[nodiscard]] auto contains(size_t offset) const -> bool {
        return offset >= start && offset < end();
    }

    /// Returns true if the two spans share at least one character.
    ///
    /// An empty span intersects a span that contains its start.
    [[nodiscard]] auto intersects(const TextSpan& other) const -> bool {
        if (length == 0) {
            return other.contains(start) || start == other.start;
        }
        if (other.length == 0) {
            return contains(other.start);
        }
        return start < other.end() && other.start < end();
    }

    [[nodiscard]] auto operator==(const TextSpan& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto config = make_reflow_config(80, true, true);
/// if (is_err(config)) {
///     std::cerr << unwrap_err(config) << "\n";
///     return 1;
/// }
/// auto engine_config = unwrap(config);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result holds an error, so check
/// with `is_ok` first.
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

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace cstudio

#endif // CSTUDIO_COMMON_HPP
