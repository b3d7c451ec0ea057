#include <gtest/gtest.h>
#include "tagmap/errors.hpp"
#include "tagmap/tag_node.hpp"

#include <string>

using namespace tagmap;

// ============================================================================
// TagNode
// ============================================================================

TEST(TagNode, TypeFollowsAlternative) {
    EXPECT_EQ(TagNode(int8_t{1}).type(), TagType::Byte);
    EXPECT_EQ(TagNode(int16_t{1}).type(), TagType::Short);
    EXPECT_EQ(TagNode(int32_t{1}).type(), TagType::Int);
    EXPECT_EQ(TagNode(int64_t{1}).type(), TagType::Long);
    EXPECT_EQ(TagNode(1.0f).type(), TagType::Float);
    EXPECT_EQ(TagNode(1.0).type(), TagType::Double);
    EXPECT_EQ(TagNode("text").type(), TagType::String);
    EXPECT_EQ(TagNode(TagByteArray{1, 2}).type(), TagType::ByteArray);
    EXPECT_EQ(TagNode(TagIntArray{1, 2}).type(), TagType::IntArray);
    EXPECT_EQ(TagNode(TagList{}).type(), TagType::List);
    EXPECT_EQ(TagNode(TagCompound{}).type(), TagType::Compound);
}

TEST(TagNode, TypedAccess) {
    TagNode node(int16_t{-300});
    ASSERT_NE(node.as<int16_t>(), nullptr);
    EXPECT_EQ(*node.as<int16_t>(), -300);
    EXPECT_EQ(node.as<int32_t>(), nullptr);
}

TEST(TagNode, TypeNames) {
    EXPECT_STREQ(tagTypeName(TagType::Compound), "Compound");
    EXPECT_STREQ(tagTypeName(TagType::IntArray), "IntArray");
    EXPECT_STREQ(tagTypeName(TagType::End), "End");
}

// ============================================================================
// TagList
// ============================================================================

TEST(TagList, EmptyHasEndType) {
    TagList list;
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.elementType(), TagType::End);
}

TEST(TagList, FirstElementFixesType) {
    TagList list;
    list.add(TagNode("a"));
    list.add(TagNode("b"));
    EXPECT_EQ(list.elementType(), TagType::String);
    EXPECT_EQ(list.size(), 2u);
    EXPECT_EQ(*list.at(1).as<std::string>(), "b");
}

TEST(TagList, MixedElementThrows) {
    TagList list;
    list.add(TagNode(int32_t{1}));
    list.add(TagNode(int32_t{2}));

    try {
        list.add(TagNode(int64_t{3}));
        FAIL() << "Expected StructuralError";
    } catch (const StructuralError& e) {
        EXPECT_NE(std::string(e.what()).find("element 2"), std::string::npos);
    }
    EXPECT_EQ(list.size(), 2u);
}

TEST(TagList, ClearResetsType) {
    TagList list;
    list.add(TagNode(1.0));
    list.clear();
    EXPECT_EQ(list.elementType(), TagType::End);
    list.add(TagNode("now strings"));
    EXPECT_EQ(list.elementType(), TagType::String);
}

// ============================================================================
// TagCompound
// ============================================================================

TEST(TagCompound, SetOverwritesInPlace) {
    TagCompound compound;
    compound.set("a", TagNode(int32_t{1}));
    compound.set("b", TagNode(int32_t{2}));
    compound.set("a", TagNode("replaced"));

    auto keys = compound.keys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "a");
    EXPECT_EQ(keys[1], "b");
    EXPECT_EQ(compound.get("a")->type(), TagType::String);
}

TEST(TagCompound, RemoveAndContains) {
    TagCompound compound;
    compound.set("a", TagNode(int8_t{1}));

    EXPECT_TRUE(compound.contains("a"));
    EXPECT_TRUE(compound.remove("a"));
    EXPECT_FALSE(compound.contains("a"));
    EXPECT_FALSE(compound.remove("a"));
    EXPECT_EQ(compound.get("a"), nullptr);
}

TEST(TagCompound, EqualityIgnoresOrder) {
    TagCompound first;
    first.set("x", TagNode(int32_t{1}));
    first.set("y", TagNode("two"));

    TagCompound second;
    second.set("y", TagNode("two"));
    second.set("x", TagNode(int32_t{1}));

    EXPECT_EQ(first, second);

    second.set("x", TagNode(int64_t{1}));
    EXPECT_FALSE(first == second);
}

TEST(TagCompound, NestedCopyIsDeep) {
    TagCompound inner;
    inner.set("v", TagNode(int32_t{1}));

    TagCompound outer;
    outer.set("inner", TagNode(inner));

    TagCompound copy = outer;
    copy.get("inner")->as<TagCompound>()->set("v", TagNode(int32_t{2}));

    EXPECT_EQ(*outer.get("inner")->as<TagCompound>()->get("v")->as<int32_t>(), 1);
    EXPECT_EQ(*copy.get("inner")->as<TagCompound>()->get("v")->as<int32_t>(), 2);
}
