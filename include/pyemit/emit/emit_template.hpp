//! # Emit Templates
//!
//! Raw target-language snippets with placeholders bound to the argument
//! expressions of an `ast::Emit` node.
//!
//! ## Placeholder Forms
//!
//! Three whole-string rewrites run first, in this order:
//!
//! | Form                | Becomes                                              |
//! |---------------------|------------------------------------------------------|
//! | `$i...`             | `$i, $i+1, ..., $N-1` (empty when `i >= N`)          |
//! | `{{ $i ? A : B }}`  | `A` if argument `i` is a constant, else `B`          |
//! | `{{ ... $i ... }}`  | the inner text if argument `i` exists, else nothing  |
//!
//! The result is then split on bare `$<digits>` tokens into literal segments
//! and argument references. `render()` replays the segments: literals are
//! printed line by line, arguments through the caller, and a reference past
//! the last argument prints `None`.
//!
//! Rewrites depend only on the argument count and on which arguments are
//! constants, so a `TemplateCache` keyed on those facts compiles each
//! template once per shape.

#ifndef PYEMIT_EMIT_EMIT_TEMPLATE_HPP
#define PYEMIT_EMIT_EMIT_TEMPLATE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pyemit::emit {

/// Reference to argument `index`. Indices too large to parse are stored as
/// `SIZE_MAX`, which is always out of range.
struct ArgRef {
    size_t index;

    [[nodiscard]] auto operator==(const ArgRef& other) const -> bool = default;
};

using Segment = std::variant<std::string, ArgRef>;

struct CompiledTemplate {
    std::vector<Segment> segments;
};

// ============================================================================
// Rewrites
// ============================================================================

[[nodiscard]] auto expand_spread(const std::string& tmpl, size_t arg_count) -> std::string;

/// `constant_args[i]` tells whether argument `i` is a literal constant.
[[nodiscard]] auto expand_conditionals(const std::string& tmpl,
                                       const std::vector<bool>& constant_args) -> std::string;

[[nodiscard]] auto expand_presence(const std::string& tmpl, size_t arg_count) -> std::string;

/// All three rewrites, in order.
[[nodiscard]] auto expand(const std::string& tmpl, const std::vector<bool>& constant_args)
    -> std::string;

/// Splits an expanded template into literals and argument references.
[[nodiscard]] auto tokenize(const std::string& expanded) -> std::vector<Segment>;

[[nodiscard]] auto compile(const std::string& tmpl, const std::vector<bool>& constant_args)
    -> CompiledTemplate;

// ============================================================================
// Cache
// ============================================================================

class TemplateCache {
public:
    /// Returns the compiled form, compiling on first use. The reference stays
    /// valid for the lifetime of the cache.
    auto get(const std::string& tmpl, const std::vector<bool>& constant_args)
        -> const CompiledTemplate&;

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    [[nodiscard]] auto hits() const -> size_t {
        return hits_;
    }

private:
    std::unordered_map<std::string, CompiledTemplate> entries_;
    size_t hits_ = 0;
};

// ============================================================================
// Rendering
// ============================================================================

/// Receiver of a rendered template.
class TemplateOutput {
public:
    virtual ~TemplateOutput() = default;

    [[nodiscard]] virtual auto column() const -> uint32_t = 0;
    virtual void text(std::string_view text) = 0;
    virtual void newline() = 0;
    /// Prints argument `index`, which is always in range.
    virtual void argument(size_t index) = 0;
};

/// Replays `tmpl` into `out`.
///
/// Literal segments are split on line terminators, with a newline between
/// consecutive pieces. Leading whitespace of a piece is dropped when the
/// output is at column 0, since the printer applies indentation itself.
void render(const CompiledTemplate& tmpl, size_t arg_count, TemplateOutput& out);

} // namespace pyemit::emit

#endif // PYEMIT_EMIT_EMIT_TEMPLATE_HPP
