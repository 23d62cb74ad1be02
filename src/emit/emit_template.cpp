//! # Emit Template Engine
//!
//! | Function              | Description                                  |
//! |-----------------------|----------------------------------------------|
//! | `expand_spread()`     | `$i...` to a comma-joined run                |
//! | `expand_conditionals()` | `{{ $i ? A : B }}` by argument constness   |
//! | `expand_presence()`   | `{{ ... $i ... }}` by argument presence      |
//! | `tokenize()`          | Split on bare `$N`                           |
//! | `render()`            | Replay segments into a `TemplateOutput`      |
//!
//! `$N` forms are matched with `std::regex`. Brace blocks have no length
//! bound and are scanned by hand in a single pass.

#include "pyemit/emit/emit_template.hpp"

#include "pyemit/log/log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <regex>

namespace pyemit::emit {

namespace {

const std::regex& spread_pattern() {
    static const std::regex re(R"(\$(\d+)\.\.\.)");
    return re;
}

const std::regex& placeholder_pattern() {
    static const std::regex re(R"(\$\d+)");
    return re;
}

auto parse_index(std::string_view digits) -> size_t {
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return SIZE_MAX;
    }
    return index;
}

/// `std::regex_replace` with a callback per match.
template <typename F>
auto replace_matches(const std::string& input, const std::regex& re, F&& replacement)
    -> std::string {
    std::string out;
    out.reserve(input.size());
    size_t last = 0;
    for (auto it = std::sregex_iterator(input.begin(), input.end(), re);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        auto pos = static_cast<size_t>(m.position(0));
        out.append(input, last, pos - last);
        out += replacement(m);
        last = pos + static_cast<size_t>(m.length(0));
    }
    out.append(input, last, std::string::npos);
    return out;
}

// ============================================================================
// Brace Blocks
// ============================================================================

/// A matched `{{ ... }}` block: the index past its closing braces and the
/// text that replaces it.
struct Block {
    size_t end;
    std::string replacement;
};

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto skip_space(std::string_view s, size_t pos) -> size_t {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return pos;
}

auto digits_at(std::string_view s, size_t pos) -> std::string_view {
    size_t end = pos;
    while (end < s.size() && is_digit(s[end])) {
        ++end;
    }
    return s.substr(pos, end - pos);
}

/// First `needle` at or after `from` with no line break in between.
auto find_on_line(std::string_view s, std::string_view needle, size_t from) -> size_t {
    size_t found = s.find(needle, from);
    if (found == std::string_view::npos)
        return found;
    size_t line_end = s.find_first_of("\r\n", from);
    return line_end < found ? std::string_view::npos : found;
}

/// Rewrites every `{{` at which `match` accepts a block. A rejected `{{` is
/// left in place and the scan resumes one character later.
template <typename F>
auto replace_blocks(std::string_view input, F&& match) -> std::string {
    std::string out;
    out.reserve(input.size());
    size_t last = 0;
    size_t open = input.find("{{");
    while (open != std::string_view::npos) {
        std::optional<Block> block = match(input, open + 2);
        if (!block) {
            open = input.find("{{", open + 1);
            continue;
        }
        out.append(input.substr(last, open - last));
        out += block->replacement;
        last = block->end;
        open = input.find("{{", last);
    }
    out.append(input.substr(last));
    return out;
}

/// `{{ $i ? A : B }}`: `A` runs to the first colon, `B` to the first `}}`.
auto match_conditional(std::string_view s, size_t pos, const std::vector<bool>& constant_args)
    -> std::optional<Block> {
    pos = skip_space(s, pos);
    if (pos >= s.size() || s[pos] != '$')
        return std::nullopt;
    auto digits = digits_at(s, pos + 1);
    if (digits.empty())
        return std::nullopt;
    pos = skip_space(s, pos + 1 + digits.size());
    if (pos >= s.size() || s[pos] != '?')
        return std::nullopt;

    size_t colon = find_on_line(s, ":", pos + 1);
    if (colon == std::string_view::npos)
        return std::nullopt;
    size_t close = find_on_line(s, "}}", colon + 1);
    if (close == std::string_view::npos)
        return std::nullopt;

    size_t i = parse_index(digits);
    // A missing argument is not a constant.
    bool is_constant = i < constant_args.size() && constant_args[i];
    auto branch = is_constant ? s.substr(pos + 1, colon - pos - 1)
                              : s.substr(colon + 1, close - colon - 1);
    return Block{.end = close + 2, .replacement = std::string(branch)};
}

/// `{{ ... $i ... }}`: the last `$i` before the first `}` decides.
auto match_presence(std::string_view s, size_t pos, size_t arg_count) -> std::optional<Block> {
    size_t span_end = std::min(s.find('}', pos), s.size());
    size_t dollar = std::string_view::npos;
    for (size_t i = pos; i + 1 < span_end; ++i) {
        if (s[i] == '$' && is_digit(s[i + 1])) {
            dollar = i;
        }
    }
    if (dollar == std::string_view::npos)
        return std::nullopt;

    auto digits = digits_at(s, dollar + 1);
    size_t close = find_on_line(s, "}}", dollar + 1 + digits.size());
    if (close == std::string_view::npos)
        return std::nullopt;

    bool present = parse_index(digits) < arg_count;
    return Block{.end = close + 2,
                 .replacement = present ? std::string(s.substr(pos, close - pos)) : std::string{}};
}

auto trim_start(std::string_view text) -> std::string_view {
    size_t i = text.find_first_not_of(" \t\f\v");
    return i == std::string_view::npos ? std::string_view{} : text.substr(i);
}

void render_literal(std::string_view literal, TemplateOutput& out) {
    size_t start = 0;
    while (true) {
        size_t nl = literal.find('\n', start);
        size_t count = nl == std::string_view::npos ? std::string_view::npos : nl - start;
        std::string_view piece = literal.substr(start, count);
        if (!piece.empty() && piece.back() == '\r') {
            piece.remove_suffix(1);
        }

        if (out.column() == 0) {
            piece = trim_start(piece);
        }
        if (!piece.empty()) {
            out.text(piece);
        }

        if (nl == std::string_view::npos)
            break;
        out.newline();
        start = nl + 1;
    }
}

} // namespace

auto expand_spread(const std::string& tmpl, size_t arg_count) -> std::string {
    return replace_matches(tmpl, spread_pattern(), [&](const std::smatch& m) {
        std::string run;
        for (size_t j = parse_index(m.str(1)); j < arg_count; ++j) {
            if (!run.empty())
                run += ", ";
            run += "$" + std::to_string(j);
        }
        return run;
    });
}

auto expand_conditionals(const std::string& tmpl, const std::vector<bool>& constant_args)
    -> std::string {
    return replace_blocks(tmpl, [&](std::string_view s, size_t pos) {
        return match_conditional(s, pos, constant_args);
    });
}

auto expand_presence(const std::string& tmpl, size_t arg_count) -> std::string {
    return replace_blocks(tmpl, [&](std::string_view s, size_t pos) {
        return match_presence(s, pos, arg_count);
    });
}

auto expand(const std::string& tmpl, const std::vector<bool>& constant_args) -> std::string {
    auto spread = expand_spread(tmpl, constant_args.size());
    auto conditional = expand_conditionals(spread, constant_args);
    return expand_presence(conditional, constant_args.size());
}

auto tokenize(const std::string& expanded) -> std::vector<Segment> {
    std::vector<Segment> segments;
    size_t last = 0;
    for (auto it = std::sregex_iterator(expanded.begin(), expanded.end(), placeholder_pattern());
         it != std::sregex_iterator(); ++it) {
        auto pos = static_cast<size_t>(it->position(0));
        auto len = static_cast<size_t>(it->length(0));
        if (pos > last) {
            segments.emplace_back(expanded.substr(last, pos - last));
        }
        auto digits = std::string_view(expanded).substr(pos + 1, len - 1);
        segments.emplace_back(ArgRef{parse_index(digits)});
        last = pos + len;
    }
    if (last < expanded.size()) {
        segments.emplace_back(expanded.substr(last));
    }
    return segments;
}

auto compile(const std::string& tmpl, const std::vector<bool>& constant_args)
    -> CompiledTemplate {
    return CompiledTemplate{.segments = tokenize(expand(tmpl, constant_args))};
}

auto TemplateCache::get(const std::string& tmpl, const std::vector<bool>& constant_args)
    -> const CompiledTemplate& {
    std::string key = tmpl;
    key += '\0';
    for (bool c : constant_args) {
        key += c ? 'C' : 'N';
    }

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    PYEMIT_LOG_TRACE("emit", "Compiling template '" << tmpl << "' for " << constant_args.size()
                                                    << " argument(s)");
    auto [inserted, _] = entries_.emplace(std::move(key), compile(tmpl, constant_args));
    return inserted->second;
}

void render(const CompiledTemplate& tmpl, size_t arg_count, TemplateOutput& out) {
    for (const auto& segment : tmpl.segments) {
        if (const auto* literal = std::get_if<std::string>(&segment)) {
            render_literal(*literal, out);
        } else {
            size_t index = std::get<ArgRef>(segment).index;
            if (index < arg_count) {
                out.argument(index);
            } else {
                PYEMIT_LOG_DEBUG("emit", "Template argument $" << index << " out of range ("
                                                               << arg_count << " given)");
                out.text("None");
            }
        }
    }
}

} // namespace pyemit::emit
