//! # Source Map Revision 3
//!
//! Mapping collection, Base64 VLQ encoding and JSON serialisation.

#include "pyemit/sourcemap/source_map.hpp"

#include "pyemit/log/log.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace pyemit::sourcemap {

namespace {

const char b64_encode_table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int VLQ_BASE_SHIFT = 5;
constexpr int64_t VLQ_BASE_MASK = (1 << VLQ_BASE_SHIFT) - 1;
constexpr int64_t VLQ_CONTINUATION_BIT = 1 << VLQ_BASE_SHIFT;

std::string json_escape(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 2);
    for (char c : str) {
        if (c == '"')
            result += "\\\"";
        else if (c == '\\')
            result += "\\\\";
        else if (c == '\n')
            result += "\\n";
        else if (c == '\r')
            result += "\\r";
        else if (c == '\t')
            result += "\\t";
        else if (static_cast<unsigned char>(c) < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
            result += buf;
        } else
            result += c;
    }
    return result;
}

} // namespace

void encode_vlq(std::string& out, int64_t value) {
    // Sign goes in the least significant bit.
    uint64_t vlq = value < 0 ? ((static_cast<uint64_t>(-(value + 1)) + 1) << 1) | 1
                             : static_cast<uint64_t>(value) << 1;
    do {
        auto digit = static_cast<int64_t>(vlq & VLQ_BASE_MASK);
        vlq >>= VLQ_BASE_SHIFT;
        if (vlq > 0) {
            digit |= VLQ_CONTINUATION_BIT;
        }
        out += b64_encode_table[digit];
    } while (vlq > 0);
}

SourceMapV3::SourceMapV3(std::string file, std::string source)
    : file_(std::move(file)), source_(std::move(source)) {}

void SourceMapV3::add_mapping(uint32_t original_line, uint32_t original_column,
                              uint32_t generated_line, uint32_t generated_column,
                              const std::optional<std::string>& name) {
    if (name && !name_index_.contains(*name)) {
        name_index_.emplace(*name, names_.size());
        names_.push_back(*name);
    }
    mappings_.push_back(Mapping{.original_line = original_line,
                                .original_column = original_column,
                                .generated_line = generated_line,
                                .generated_column = generated_column,
                                .name = name});
}

auto SourceMapV3::encode_mappings() const -> std::string {
    // Printing is append-only, so mappings normally arrive in order already.
    std::vector<const Mapping*> ordered;
    ordered.reserve(mappings_.size());
    for (const auto& m : mappings_) {
        ordered.push_back(&m);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Mapping* a, const Mapping* b) {
        if (a->generated_line != b->generated_line)
            return a->generated_line < b->generated_line;
        return a->generated_column < b->generated_column;
    });

    std::string out;
    uint32_t line = 1;
    int64_t prev_gen_col = 0;
    int64_t prev_orig_line = 0;
    int64_t prev_orig_col = 0;
    int64_t prev_name = 0;
    bool first_in_line = true;

    for (const Mapping* m : ordered) {
        while (line < m->generated_line) {
            out += ';';
            ++line;
            prev_gen_col = 0;
            first_in_line = true;
        }
        if (!first_in_line) {
            out += ',';
        }
        first_in_line = false;

        int64_t orig_line = m->original_line > 0 ? m->original_line - 1 : 0;

        encode_vlq(out, static_cast<int64_t>(m->generated_column) - prev_gen_col);
        encode_vlq(out, 0); // single source
        encode_vlq(out, orig_line - prev_orig_line);
        encode_vlq(out, static_cast<int64_t>(m->original_column) - prev_orig_col);

        prev_gen_col = m->generated_column;
        prev_orig_line = orig_line;
        prev_orig_col = m->original_column;

        if (m->name) {
            auto index = static_cast<int64_t>(name_index_.at(*m->name));
            encode_vlq(out, index - prev_name);
            prev_name = index;
        }
    }
    return out;
}

auto SourceMapV3::to_json() const -> std::string {
    std::ostringstream json;
    json << "{\"version\":3,\"file\":\"" << json_escape(file_) << "\",\"sources\":[\""
         << json_escape(source_) << "\"],\"names\":[";
    for (size_t i = 0; i < names_.size(); ++i) {
        if (i > 0)
            json << ",";
        json << "\"" << json_escape(names_[i]) << "\"";
    }
    json << "],\"mappings\":\"" << encode_mappings() << "\"}";

    PYEMIT_LOG_DEBUG("sourcemap",
                     "Serialised " << mappings_.size() << " mappings for " << file_);
    return json.str();
}

} // namespace pyemit::sourcemap
