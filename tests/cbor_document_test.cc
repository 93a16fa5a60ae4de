#include "opencbor/cbor_document.h"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace opencbor {

TEST(CborDocument, BuildsNestedTree)
{
    CborDocument doc;
    const CborNodeId one  = doc.add_value(make_cbor_int(1));
    const CborNodeId text = doc.add_text("name");
    const std::array<std::byte, 2> raw = { std::byte { 0xDE },
                                           std::byte { 0xAD } };
    const CborNodeId blob = doc.add_bytes(raw);

    const std::array<CborNodeId, 2> items = { one, blob };
    const CborNodeId arr                  = doc.add_array(items);

    const std::array<CborMapPair, 1> pairs = { CborMapPair { text, arr } };
    const CborNodeId map                   = doc.add_map(pairs);
    doc.set_root(map);

    ASSERT_TRUE(doc.valid(map));
    EXPECT_EQ(doc.root(), map);
    EXPECT_EQ(doc.node_count(), 5U);
    EXPECT_EQ(doc.node(map).count, 1U);

    const CborNodeId found = doc.find_map_text(map, "name");
    ASSERT_EQ(found, arr);
    ASSERT_EQ(doc.array_items(found).size(), 2U);
    EXPECT_EQ(doc.bytes(doc.array_items(found)[1]).size(), 2U);
    EXPECT_EQ(doc.find_map_text(map, "other"), kInvalidCborNodeId);
    EXPECT_EQ(doc.find_map_int(map, 1), kInvalidCborNodeId);
}


TEST(CborDocument, RejectsForwardReferences)
{
    CborDocument doc;
    const std::array<CborNodeId, 1> items = { 7 };
    EXPECT_EQ(doc.add_array(items), kInvalidCborNodeId);
    EXPECT_EQ(doc.add_tagged(1, 0), kInvalidCborNodeId);
    const std::array<CborMapPair, 1> pairs = { CborMapPair { 0, 0 } };
    EXPECT_EQ(doc.add_map(pairs), kInvalidCborNodeId);
    EXPECT_EQ(doc.node_count(), 0U);
}


TEST(CborDocument, AddValueOnlyAcceptsScalars)
{
    CborDocument doc;
    CborValue v;
    v.kind = CborValueKind::Array;
    EXPECT_EQ(doc.add_value(v), kInvalidCborNodeId);
    EXPECT_NE(doc.add_value(make_cbor_float(0.5)), kInvalidCborNodeId);
    EXPECT_NE(doc.add_value(make_cbor_bool(true)), kInvalidCborNodeId);
}


TEST(CborDocument, InvalidIdsReadAsUndefined)
{
    CborDocument doc;
    const CborValue& v = doc.node(kInvalidCborNodeId);
    EXPECT_EQ(v.kind, CborValueKind::Simple);
    EXPECT_EQ(v.simple, CborSimple::Undefined);
    EXPECT_TRUE(doc.array_items(3).empty());
    EXPECT_TRUE(doc.map_pairs(3).empty());
    EXPECT_TRUE(doc.bytes(3).empty());
    std::string s;
    EXPECT_FALSE(doc.text_utf8(3, &s));

    doc.set_root(42);
    EXPECT_EQ(doc.root(), kInvalidCborNodeId);
}


TEST(CborDocument, StructuralEquality)
{
    CborDocument doc;
    const CborNodeId a1 = doc.add_value(make_cbor_int(-5));
    const CborNodeId a2 = doc.add_value(make_cbor_int(-5));
    const CborNodeId f1 = doc.add_value(make_cbor_float(-5.0));
    const CborNodeId t1 = doc.add_text("k");
    const CborNodeId t2 = doc.add_text("k");

    EXPECT_TRUE(doc.equal(a1, a2));
    EXPECT_EQ(doc.hash(a1), doc.hash(a2));
    EXPECT_FALSE(doc.equal(a1, f1));
    EXPECT_TRUE(doc.equal(t1, t2));
    EXPECT_EQ(doc.hash(t1), doc.hash(t2));

    const std::array<CborNodeId, 2> x = { a1, t1 };
    const std::array<CborNodeId, 2> y = { a2, t2 };
    const std::array<CborNodeId, 2> z = { t2, a2 };
    const CborNodeId ax               = doc.add_array(x);
    const CborNodeId ay               = doc.add_array(y);
    const CborNodeId az               = doc.add_array(z);
    EXPECT_TRUE(doc.equal(ax, ay));
    EXPECT_EQ(doc.hash(ax), doc.hash(ay));
    EXPECT_FALSE(doc.equal(ax, az));

    const CborNodeId g1 = doc.add_tagged(1, ax);
    const CborNodeId g2 = doc.add_tagged(1, ay);
    const CborNodeId g3 = doc.add_tagged(2, ay);
    EXPECT_TRUE(doc.equal(g1, g2));
    EXPECT_FALSE(doc.equal(g1, g3));

    EXPECT_TRUE(doc.equal(doc.add_value(make_cbor_custom_simple(40)),
                          doc.add_value(make_cbor_custom_simple(40))));
    EXPECT_FALSE(doc.equal(doc.add_value(make_cbor_custom_simple(40)),
                           doc.add_value(make_cbor_custom_simple(41))));
}


TEST(CborDocument, ClearResetsEverything)
{
    CborDocument doc;
    doc.set_root(doc.add_text("x"));
    ASSERT_TRUE(doc.valid(doc.root()));
    doc.clear();
    EXPECT_EQ(doc.node_count(), 0U);
    EXPECT_EQ(doc.root(), kInvalidCborNodeId);
}


TEST(CborDocument, Utf16ToUtf8)
{
    const std::array<char16_t, 5> units = { u'A', static_cast<char16_t>(0xD83D),
                                            static_cast<char16_t>(0xDE00),
                                            static_cast<char16_t>(0xDC00),
                                            u'\u00E9' };
    std::string out;
    append_utf16_as_utf8(units, &out);
    EXPECT_EQ(out, "A\xF0\x9F\x98\x80\xEF\xBF\xBD\xC3\xA9");
}


TEST(CborDocument, Utf8ToUtf16IsStrict)
{
    std::vector<char16_t> units;
    ASSERT_TRUE(append_utf8_as_utf16("\xE2\x82\xAC", &units));
    ASSERT_EQ(units.size(), 1U);
    EXPECT_EQ(units[0], u'\u20AC');

    units.clear();
    EXPECT_FALSE(append_utf8_as_utf16("\xE2\x82", &units));
    units.clear();
    EXPECT_FALSE(append_utf8_as_utf16("\xFF", &units));

    CborDocument doc;
    EXPECT_EQ(doc.add_text("\xC3"), kInvalidCborNodeId);
}

}  // namespace opencbor
