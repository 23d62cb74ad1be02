//! # Source Maps
//!
//! The printer reports `(original, generated)` coordinate pairs to a
//! `SourceMapGenerator`. It never reads anything back, so the generator is
//! free to stream, collect, or drop them.
//!
//! ## Coordinates
//!
//! Lines are 1-based and columns 0-based on both sides, matching
//! `ast::Position`. `SourceMapV3` converts lines to the 0-based form the
//! Revision 3 format uses when it serialises.
//!
//! ## Encoding
//!
//! `SourceMapV3::to_json()` produces:
//!
//! ```json
//! {"version":3,"file":"out.py","sources":["in.fs"],"names":["x"],"mappings":"AAAA;IACE"}
//! ```
//!
//! Each segment holds up to five Base64 VLQ fields, each relative to the
//! previous segment: generated column (reset per line), source index, original
//! line, original column, and name index.

#ifndef PYEMIT_SOURCEMAP_SOURCE_MAP_HPP
#define PYEMIT_SOURCEMAP_SOURCE_MAP_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pyemit::sourcemap {

/// Receives coordinate pairs from the printer.
class SourceMapGenerator {
public:
    virtual ~SourceMapGenerator() = default;

    virtual void add_mapping(uint32_t original_line, uint32_t original_column,
                             uint32_t generated_line, uint32_t generated_column,
                             const std::optional<std::string>& name) = 0;
};

/// Drops every mapping.
class NullSourceMap : public SourceMapGenerator {
public:
    void add_mapping(uint32_t, uint32_t, uint32_t, uint32_t,
                     const std::optional<std::string>&) override {}
};

struct Mapping {
    uint32_t original_line;
    uint32_t original_column;
    uint32_t generated_line;
    uint32_t generated_column;
    std::optional<std::string> name;

    [[nodiscard]] auto operator==(const Mapping& other) const -> bool = default;
};

/// Collects mappings for one compilation unit and serialises them as a
/// Source Map Revision 3 document.
class SourceMapV3 : public SourceMapGenerator {
public:
    SourceMapV3(std::string file, std::string source);

    void add_mapping(uint32_t original_line, uint32_t original_column, uint32_t generated_line,
                     uint32_t generated_column, const std::optional<std::string>& name) override;

    [[nodiscard]] auto mappings() const -> const std::vector<Mapping>& {
        return mappings_;
    }

    [[nodiscard]] auto names() const -> const std::vector<std::string>& {
        return names_;
    }

    /// The `mappings` field alone.
    [[nodiscard]] auto encode_mappings() const -> std::string;

    [[nodiscard]] auto to_json() const -> std::string;

private:
    std::string file_;
    std::string source_;
    std::vector<Mapping> mappings_;
    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> name_index_;
};

/// Appends the Base64 VLQ encoding of `value` to `out`.
void encode_vlq(std::string& out, int64_t value);

} // namespace pyemit::sourcemap

#endif // PYEMIT_SOURCEMAP_SOURCE_MAP_HPP
