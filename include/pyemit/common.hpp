//! # Common Definitions
//!
//! Shared vocabulary for every pyemit module: the `Result<T, E>` error type
//! and the owning pointer alias used by the AST.
//!
//! ## Design Philosophy
//!
//! - **No Exceptions across APIs**: expected failures are returned via
//!   `Result<T, E>` or recorded in a `diag::DiagnosticSink`
//! - **Explicit Ownership**: `Box<T>` for unique ownership

#ifndef PYEMIT_COMMON_HPP
#define PYEMIT_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace pyemit {

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto written = writer.write(chunk);
/// if (is_err(written)) {
///     report(unwrap_err(written));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on a success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Alias
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Helper for `static_assert` in the last branch of an exhaustive
/// `if constexpr` chain over a variant.
template <typename> inline constexpr bool always_false_v = false;

} // namespace pyemit

#endif // PYEMIT_COMMON_HPP
