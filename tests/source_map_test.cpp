//! # Source Map Tests
//!
//! Base64 VLQ encoding and Revision 3 serialisation.

#include "pyemit/sourcemap/source_map.hpp"

#include <gtest/gtest.h>

using namespace pyemit::sourcemap;

namespace {

auto vlq(int64_t value) -> std::string {
    std::string out;
    encode_vlq(out, value);
    return out;
}

} // namespace

// ============================================================================
// VLQ
// ============================================================================

TEST(VlqTest, SmallValues) {
    EXPECT_EQ(vlq(0), "A");
    EXPECT_EQ(vlq(1), "C");
    EXPECT_EQ(vlq(-1), "D");
    EXPECT_EQ(vlq(15), "e");
    EXPECT_EQ(vlq(-15), "f");
}

TEST(VlqTest, MultiDigitValues) {
    EXPECT_EQ(vlq(16), "gB");
    EXPECT_EQ(vlq(-16), "hB");
    EXPECT_EQ(vlq(123), "2H");
    EXPECT_EQ(vlq(1024), "ggC");
}

// ============================================================================
// SourceMapV3
// ============================================================================

TEST(SourceMapV3Test, EmptyMap) {
    SourceMapV3 map("out.py", "in.fs");
    EXPECT_EQ(map.encode_mappings(), "");
    EXPECT_EQ(map.to_json(),
              "{\"version\":3,\"file\":\"out.py\",\"sources\":[\"in.fs\"],\"names\":[],"
              "\"mappings\":\"\"}");
}

TEST(SourceMapV3Test, RelativeFieldsAcrossLines) {
    SourceMapV3 map("out.py", "in.fs");
    map.add_mapping(1, 0, 1, 0, std::nullopt);
    map.add_mapping(2, 2, 2, 4, std::string("x"));

    EXPECT_EQ(map.encode_mappings(), "AAAA;IACEA");
}

TEST(SourceMapV3Test, SkippedGeneratedLines) {
    SourceMapV3 map("out.py", "in.fs");
    map.add_mapping(1, 0, 1, 0, std::nullopt);
    map.add_mapping(5, 0, 4, 0, std::nullopt);

    // Lines 2 and 3 have no segments; original line moves by 4.
    EXPECT_EQ(map.encode_mappings(), "AAAA;;;AAIA");
}

TEST(SourceMapV3Test, SameLineSegmentsAreCommaSeparated) {
    SourceMapV3 map("out.py", "in.fs");
    map.add_mapping(1, 0, 1, 0, std::nullopt);
    map.add_mapping(1, 4, 1, 6, std::nullopt);

    EXPECT_EQ(map.encode_mappings(), "AAAA,MAAI");
}

TEST(SourceMapV3Test, OutOfOrderMappingsAreSorted) {
    SourceMapV3 map("out.py", "in.fs");
    map.add_mapping(1, 4, 1, 6, std::nullopt);
    map.add_mapping(1, 0, 1, 0, std::nullopt);

    EXPECT_EQ(map.encode_mappings(), "AAAA,MAAI");
}

TEST(SourceMapV3Test, NamesAreDeduplicated) {
    SourceMapV3 map("out.py", "in.fs");
    map.add_mapping(1, 0, 1, 0, std::string("count"));
    map.add_mapping(2, 0, 2, 0, std::string("total"));
    map.add_mapping(3, 0, 3, 0, std::string("count"));

    ASSERT_EQ(map.names().size(), 2u);
    EXPECT_EQ(map.names()[0], "count");
    EXPECT_EQ(map.names()[1], "total");
    // Name indices 0, +1, -1.
    EXPECT_EQ(map.encode_mappings(), "AAAAA;AACAC;AACAD");
}

TEST(SourceMapV3Test, JsonEscapesFileNames) {
    SourceMapV3 map("dir\\out.py", "my \"src\".fs");
    map.add_mapping(1, 0, 1, 0, std::nullopt);

    EXPECT_EQ(map.to_json(),
              "{\"version\":3,\"file\":\"dir\\\\out.py\",\"sources\":[\"my \\\"src\\\".fs\"],"
              "\"names\":[],\"mappings\":\"AAAA\"}");
}

TEST(NullSourceMapTest, AcceptsMappings) {
    NullSourceMap map;
    SourceMapGenerator& generator = map;
    EXPECT_NO_THROW(generator.add_mapping(1, 0, 1, 0, std::string("x")));
}
