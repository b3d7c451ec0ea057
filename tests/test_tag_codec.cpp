#include <gtest/gtest.h>
#include "tagmap/errors.hpp"
#include "tagmap/tag_codec.hpp"
#include "test_objects.hpp"

#include <string>

using namespace tagmap;

namespace {

// Compound nested `levels` deep: {n: {n: {...}}}
TagNode nestedCompound(size_t levels) {
    TagNode node(TagCompound{});
    for (size_t i = 1; i < levels; ++i) {
        TagCompound outer;
        outer.set("n", std::move(node));
        node = TagNode(std::move(outer));
    }
    return node;
}

// Section chain `levels` deep (the root counts as one)
void buildChain(Section& root, size_t levels) {
    Section* current = &root;
    for (size_t i = 1; i < levels; ++i) {
        current = &current->createSection("n");
    }
}

}  // namespace

class TagCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::registerTestTypes(registry);
    }

    ObjectRegistry registry;
    TagCodec codec{registry};
};

// ============================================================================
// Primitive Decoding
// ============================================================================

TEST_F(TagCodecTest, NullNodeDecodesToNull) {
    EXPECT_TRUE(codec.decode(nullptr).isNull());
}

TEST_F(TagCodecTest, PrimitivesKeepWidth) {
    TagNode byteNode(int8_t{-3});
    TagNode shortNode(int16_t{1200});
    TagNode intNode(int32_t{70000});
    TagNode longNode(int64_t{1} << 40);
    TagNode floatNode(1.5f);
    TagNode doubleNode(2.25);
    TagNode stringNode("abc");

    EXPECT_EQ(*codec.decode(&byteNode).as<int8_t>(), -3);
    EXPECT_EQ(*codec.decode(&shortNode).as<int16_t>(), 1200);
    EXPECT_EQ(*codec.decode(&intNode).as<int32_t>(), 70000);
    EXPECT_EQ(*codec.decode(&longNode).as<int64_t>(), int64_t{1} << 40);
    EXPECT_FLOAT_EQ(*codec.decode(&floatNode).as<float>(), 1.5f);
    EXPECT_DOUBLE_EQ(*codec.decode(&doubleNode).as<double>(), 2.25);
    EXPECT_EQ(*codec.decode(&stringNode).as<std::string>(), "abc");
}

TEST_F(TagCodecTest, ArraysDecodeToArrays) {
    TagNode bytes(TagByteArray{1, -1, 7});
    TagNode ints(TagIntArray{100, 200});

    ConfigValue decodedBytes = codec.decode(&bytes);
    ConfigValue decodedInts = codec.decode(&ints);

    ASSERT_NE(decodedBytes.as<ByteArray>(), nullptr);
    EXPECT_EQ(*decodedBytes.as<ByteArray>(), (ByteArray{1, -1, 7}));
    ASSERT_NE(decodedInts.as<IntArray>(), nullptr);
    EXPECT_EQ(*decodedInts.as<IntArray>(), (IntArray{100, 200}));
}

// ============================================================================
// Compound Decoding
// ============================================================================

TEST_F(TagCodecTest, CompoundWithoutParentIsDetached) {
    TagCompound compound;
    compound.set("x", TagNode(int32_t{1}));
    TagNode node(compound);

    ConfigValue value = codec.decode(&node);
    ASSERT_NE(value.section(), nullptr);
    EXPECT_EQ(value.section()->parent(), nullptr);
    EXPECT_EQ(value.section()->get<int32_t>("x"), 1);
}

TEST_F(TagCodecTest, CompoundWithParentIsLinkedNotInserted) {
    TagCompound inner;
    inner.set("leaf", TagNode("v"));
    TagCompound outer;
    outer.set("inner", TagNode(inner));
    TagNode node(outer);

    Section root;
    ConfigValue value = codec.decode(&node, "top", &root);

    ASSERT_NE(value.section(), nullptr);
    EXPECT_EQ(value.section()->parent(), &root);
    EXPECT_EQ(value.section()->path(), "top");
    EXPECT_TRUE(root.empty());

    root.set("top", std::move(value));
    Section* top = root.getSection("top");
    ASSERT_NE(top, nullptr);
    Section* nested = top->getSection("inner");
    ASSERT_NE(nested, nullptr);
    EXPECT_EQ(nested->parent(), top);
    EXPECT_EQ(nested->path(), "top.inner");
}

TEST_F(TagCodecTest, DecodeCompoundKeepsAllMembers) {
    TagCompound compound;
    compound.set("a", TagNode(int8_t{1}));
    compound.set("b", TagNode(TagCompound{}));

    auto section = codec.decodeCompound(compound);
    EXPECT_EQ(section->parent(), nullptr);
    EXPECT_EQ(section->size(), 2u);
    ASSERT_NE(section->getSection("b"), nullptr);
    EXPECT_EQ(section->getSection("b")->parent(), section.get());
}

// ============================================================================
// List Decoding
// ============================================================================

TEST_F(TagCodecTest, ListDecodesToSequence) {
    TagList list;
    list.add(TagNode("a"));
    list.add(TagNode("b"));
    TagNode node(list);

    ConfigValue value = codec.decode(&node);
    const Sequence* sequence = value.as<Sequence>();
    ASSERT_NE(sequence, nullptr);
    ASSERT_EQ(sequence->size(), 2u);
    EXPECT_EQ(*(*sequence)[1].as<std::string>(), "b");
}

TEST_F(TagCodecTest, NestedListsAreDropped) {
    TagList inner;
    inner.add(TagNode(int32_t{1}));

    TagList outer;
    outer.add(TagNode(inner));
    outer.add(TagNode(inner));
    TagNode node(outer);

    ConfigValue value = codec.decode(&node);
    ASSERT_NE(value.as<Sequence>(), nullptr);
    EXPECT_TRUE(value.as<Sequence>()->empty());
}

TEST_F(TagCodecTest, ListOfCompoundsDecodesDetachedSections) {
    TagCompound element;
    element.set("k", TagNode(int32_t{9}));
    TagList list;
    list.add(TagNode(element));
    TagNode node(list);

    Section root;
    ConfigValue value = codec.decode(&node, "entries", &root);
    const Sequence* sequence = value.as<Sequence>();
    ASSERT_NE(sequence, nullptr);
    ASSERT_EQ(sequence->size(), 1u);
    ASSERT_NE((*sequence)[0].section(), nullptr);
    EXPECT_EQ((*sequence)[0].section()->parent(), nullptr);
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(TagCodecTest, NullEncodesToNothing) {
    EXPECT_FALSE(codec.encode(ConfigValue()).has_value());
    EXPECT_FALSE(codec.encode(ConfigValue(ObjectRef{})).has_value());
    EXPECT_FALSE(codec.encode(ConfigValue(std::unique_ptr<Section>{})).has_value());
}

TEST_F(TagCodecTest, BoolEncodesAsByte) {
    auto yes = codec.encode(ConfigValue(true));
    auto no = codec.encode(ConfigValue(false));

    ASSERT_TRUE(yes.has_value());
    EXPECT_EQ(yes->type(), TagType::Byte);
    EXPECT_EQ(*yes->as<int8_t>(), 1);
    EXPECT_EQ(*no->as<int8_t>(), 0);
}

TEST_F(TagCodecTest, WidthsSurviveEncoding) {
    EXPECT_EQ(codec.encode(ConfigValue(int16_t{5}))->type(), TagType::Short);
    EXPECT_EQ(codec.encode(ConfigValue(int64_t{5}))->type(), TagType::Long);
    EXPECT_EQ(codec.encode(ConfigValue(1.0f))->type(), TagType::Float);
    EXPECT_EQ(codec.encode(ConfigValue(IntArray{1}))->type(), TagType::IntArray);
}

TEST_F(TagCodecTest, LongAndDoubleArraysAreRejected) {
    EXPECT_THROW((void)codec.encode(ConfigValue(LongArray{1, 2})), EncodingError);
    EXPECT_THROW((void)codec.encode(ConfigValue(DoubleArray{1.0})), EncodingError);
}

TEST_F(TagCodecTest, EmptySequenceEncodesToEmptyList) {
    auto node = codec.encode(ConfigValue(Sequence{}));
    ASSERT_TRUE(node.has_value());
    const TagList* list = node->as<TagList>();
    ASSERT_NE(list, nullptr);
    EXPECT_TRUE(list->empty());
    EXPECT_EQ(list->elementType(), TagType::End);
}

TEST_F(TagCodecTest, NestedSequencesAreDropped) {
    Sequence nested;
    nested.emplace_back(int32_t{2});

    Sequence sequence;
    sequence.emplace_back(int32_t{1});
    sequence.emplace_back(std::move(nested));
    sequence.emplace_back(int32_t{3});

    auto node = codec.encode(ConfigValue(std::move(sequence)));
    ASSERT_TRUE(node.has_value());
    const TagList* list = node->as<TagList>();
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->size(), 2u);
    EXPECT_EQ(*list->at(0).as<int32_t>(), 1);
    EXPECT_EQ(*list->at(1).as<int32_t>(), 3);
}

TEST_F(TagCodecTest, MixedSequenceIsRejected) {
    Sequence sequence;
    sequence.emplace_back(int32_t{1});
    sequence.emplace_back("two");

    try {
        (void)codec.encode(ConfigValue(std::move(sequence)));
        FAIL() << "Expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_NE(std::string(e.what()).find("element 1 is String, expected Int"),
                  std::string::npos);
    }
}

TEST_F(TagCodecTest, SectionOmitsNullObjects) {
    Section section;
    section.set("kept", "yes");
    section.set("gone", ConfigValue(ObjectRef{}));

    TagCompound compound = codec.encodeSection(section);
    EXPECT_TRUE(compound.contains("kept"));
    EXPECT_FALSE(compound.contains("gone"));
}

TEST_F(TagCodecTest, FailedEncodeIsAllOrNothing) {
    Section section;
    section.set("fine", int32_t{1});
    section.createSection("bad").set("longs", LongArray{1});

    EXPECT_THROW((void)codec.encodeSection(section), EncodingError);
}

// ============================================================================
// Round Trips
// ============================================================================

TEST_F(TagCodecTest, CompoundRoundTrip) {
    TagList names;
    names.add(TagNode("a"));
    names.add(TagNode("b"));

    TagCompound nested;
    nested.set("depth", TagNode(int16_t{2}));

    TagCompound original;
    original.set("byte", TagNode(int8_t{1}));
    original.set("long", TagNode(int64_t{-5}));
    original.set("double", TagNode(0.5));
    original.set("bytes", TagNode(TagByteArray{1, 2}));
    original.set("ints", TagNode(TagIntArray{3, 4}));
    original.set("names", TagNode(names));
    original.set("nested", TagNode(nested));

    auto section = codec.decodeCompound(original);
    TagCompound encoded = codec.encodeSection(*section);
    EXPECT_EQ(encoded, original);
}

TEST_F(TagCodecTest, SectionRoundTrip) {
    Sequence shorts;
    shorts.emplace_back(int16_t{1});
    shorts.emplace_back(int16_t{-2});

    Sequence entries;
    for (int32_t i = 0; i < 2; ++i) {
        auto entry = std::make_unique<Section>();
        entry->set("index", i);
        entries.emplace_back(std::move(entry));
    }

    Section original;
    original.set("float", 1.25f);
    original.set("double", -0.125);
    original.set("bytes", ByteArray{1, -2, 3});
    original.set("shorts", std::move(shorts));
    original.set("entries", std::move(entries));
    original.set("empty", Sequence{});
    Section& outer = original.createSection("outer");
    outer.set("label", "top");
    outer.createSection("inner").set("count", int64_t{7});

    auto decoded = codec.decodeCompound(codec.encodeSection(original));
    EXPECT_EQ(*decoded, original);
    EXPECT_EQ(decoded->getSection("outer")->getSection("inner")->path(), "outer.inner");
}

TEST_F(TagCodecTest, NestedSequencesShrinkTheRoundTrip) {
    Sequence inner;
    inner.emplace_back("x");
    Sequence otherInner;
    otherInner.emplace_back("y");

    Sequence sequence;
    sequence.emplace_back("a");
    sequence.emplace_back(std::move(inner));
    sequence.emplace_back("b");
    sequence.emplace_back(std::move(otherInner));
    sequence.emplace_back("c");
    const size_t nestedCount = 2;
    const size_t originalSize = sequence.size();

    auto encoded = codec.encode(ConfigValue(std::move(sequence)));
    ASSERT_TRUE(encoded.has_value());
    ConfigValue decoded = codec.decode(&*encoded);

    const Sequence* result = decoded.as<Sequence>();
    ASSERT_NE(result, nullptr);
    ASSERT_EQ(result->size(), originalSize - nestedCount);
    EXPECT_EQ(*(*result)[0].as<std::string>(), "a");
    EXPECT_EQ(*(*result)[1].as<std::string>(), "b");
    EXPECT_EQ(*(*result)[2].as<std::string>(), "c");
}

TEST_F(TagCodecTest, ObjectRoundTrip) {
    Section section;
    section.set("spawn", std::make_shared<test::Waypoint>("spawn", 1, 64, -3));

    TagCompound encoded = codec.encodeSection(section);
    const TagCompound* envelope = encoded.get("spawn")->as<TagCompound>();
    ASSERT_NE(envelope, nullptr);
    EXPECT_EQ(*envelope->get("==")->as<std::string>(), "Waypoint");
    EXPECT_EQ(envelope->keys().front(), "==");

    auto decoded = codec.decodeCompound(encoded);
    const ObjectRef* object = decoded->getRaw("spawn")->as<ObjectRef>();
    ASSERT_NE(object, nullptr);
    auto waypoint = std::dynamic_pointer_cast<test::Waypoint>(*object);
    ASSERT_NE(waypoint, nullptr);
    EXPECT_EQ(waypoint->name(), "spawn");
    EXPECT_EQ(waypoint->y(), 64);
    EXPECT_EQ(waypoint->z(), -3);
}

TEST_F(TagCodecTest, MarkerWorksBelowTopLevel) {
    TagCompound envelope;
    envelope.set("==", TagNode("Waypoint"));
    envelope.set("name", TagNode("deep"));

    TagCompound middle;
    middle.set("target", TagNode(envelope));
    TagNode node(middle);

    ConfigValue value = codec.decode(&node);
    ASSERT_NE(value.section(), nullptr);
    const ConfigValue* target = value.section()->getRaw("target");
    ASSERT_NE(target, nullptr);
    ASSERT_NE(target->object(), nullptr);
}

TEST_F(TagCodecTest, NonStringMarkerIsRejected) {
    TagCompound envelope;
    envelope.set("==", TagNode(int32_t{5}));
    TagNode node(envelope);

    EXPECT_THROW((void)codec.decode(&node), DeserializationError);
}

// ============================================================================
// Depth Limits
// ============================================================================

TEST_F(TagCodecTest, DefaultDepthLimitIs512) {
    EXPECT_EQ(codec.options().maxDepth, 512u);

    TagNode atLimit = nestedCompound(512);
    EXPECT_NO_THROW((void)codec.decode(&atLimit));

    TagNode beyond = nestedCompound(513);
    EXPECT_THROW((void)codec.decode(&beyond), StructureTooDeepError);
}

TEST_F(TagCodecTest, CustomDepthLimitOnDecode) {
    TagCodec shallow(registry, CodecOptions{3});

    TagNode ok = nestedCompound(3);
    EXPECT_NO_THROW((void)shallow.decode(&ok));

    TagNode tooDeep = nestedCompound(4);
    try {
        (void)shallow.decode(&tooDeep);
        FAIL() << "Expected StructureTooDeepError";
    } catch (const StructureTooDeepError& e) {
        EXPECT_EQ(e.limit(), 3u);
    }
}

TEST_F(TagCodecTest, CustomDepthLimitOnEncode) {
    TagCodec shallow(registry, CodecOptions{3});

    Section ok;
    buildChain(ok, 3);
    EXPECT_NO_THROW((void)shallow.encodeSection(ok));

    Section tooDeep;
    buildChain(tooDeep, 4);
    EXPECT_THROW((void)shallow.encodeSection(tooDeep), StructureTooDeepError);
}

TEST_F(TagCodecTest, ListsCountTowardDepth) {
    TagCodec shallow(registry, CodecOptions{2});

    TagList list;
    list.add(TagNode(TagCompound{}));
    TagNode node(list);
    EXPECT_NO_THROW((void)shallow.decode(&node));

    TagCompound wrapper;
    wrapper.set("list", node);
    TagNode wrapped(wrapper);
    EXPECT_THROW((void)shallow.decode(&wrapped), StructureTooDeepError);
}

TEST_F(TagCodecTest, DeepEncodeAtDefaultLimit) {
    Section atLimit;
    buildChain(atLimit, 512);
    EXPECT_NO_THROW((void)codec.encodeSection(atLimit));

    Section beyond;
    buildChain(beyond, 513);
    EXPECT_THROW((void)codec.encodeSection(beyond), StructureTooDeepError);
}
