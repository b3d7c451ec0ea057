#include "tagmap/tag_codec.hpp"
#include "tagmap/errors.hpp"
#include "tagmap/reserved_keys.hpp"

#include <string>
#include <type_traits>
#include <typeinfo>

namespace tagmap {

TagCodec::TagCodec(const ObjectRegistry& registry, CodecOptions options)
    : registry_(registry)
    , options_(options) {}

void TagCodec::checkDepth(size_t depth) const {
    if (depth >= options_.maxDepth) {
        throw StructureTooDeepError(options_.maxDepth);
    }
}

// ============================================================================
// Decode
// ============================================================================

ConfigValue TagCodec::decode(const TagNode* node, std::optional<std::string_view> key,
                             Section* parent) const {
    if (!node) {
        return ConfigValue();
    }
    return decodeNode(*node, key, parent, 0);
}

std::unique_ptr<Section> TagCodec::decodeCompound(const TagCompound& compound) const {
    checkDepth(0);

    auto section = std::make_unique<Section>();
    for (const auto& [key, member] : compound) {
        section->set(key, decodeNode(member, key, section.get(), 1));
    }
    return section;
}

ConfigValue TagCodec::decodeNode(const TagNode& node, std::optional<std::string_view> key,
                                 Section* parent, size_t depth) const {
    return std::visit([&](const auto& v) -> ConfigValue {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, TagCompound>) {
            return decodeCompoundNode(v, key, parent, depth);
        } else if constexpr (std::is_same_v<T, TagList>) {
            return decodeListNode(v, depth);
        } else if constexpr (std::is_same_v<T, TagByteArray>) {
            return ConfigValue(ByteArray(v));
        } else if constexpr (std::is_same_v<T, TagIntArray>) {
            return ConfigValue(IntArray(v));
        } else {
            // Byte, Short, Int, Long, Float, Double, String map 1:1
            return ConfigValue(v);
        }
    }, node.value());
}

ConfigValue TagCodec::decodeCompoundNode(const TagCompound& compound,
                                         std::optional<std::string_view> key,
                                         Section* parent, size_t depth) const {
    checkDepth(depth);

    if (compound.contains(MARKER_KEY)) {
        return ConfigValue(decodeSerialized(compound, depth));
    }

    auto section = std::make_unique<Section>();
    for (const auto& [memberKey, member] : compound) {
        // Members of a live section are live too
        Section* memberParent = parent ? section.get() : nullptr;
        ConfigValue value = decodeNode(member, memberKey, memberParent, depth + 1);
        section->set(memberKey, std::move(value));
    }

    // Link only after the whole subtree decoded; parent is never touched
    if (parent && key) {
        section->linkUnder(*parent, *key);
    }
    return ConfigValue(std::move(section));
}

ObjectRef TagCodec::decodeSerialized(const TagCompound& compound, size_t depth) const {
    const TagNode* marker = compound.get(MARKER_KEY);
    const std::string* alias = marker ? marker->as<std::string>() : nullptr;
    if (!alias) {
        throw DeserializationError(std::string("Serialized type marker must be a string, found ") +
                                   (marker ? tagTypeName(marker->type()) : "nothing"));
    }

    // Payload members are always detached: nested compounds become plain
    // sections, never live children
    Section payload;
    for (const auto& [memberKey, member] : compound) {
        if (memberKey == MARKER_KEY) {
            continue;
        }
        payload.set(memberKey, decodeNode(member, std::nullopt, nullptr, depth + 1));
    }

    return registry_.deserialize(*alias, payload);
}

ConfigValue TagCodec::decodeListNode(const TagList& list, size_t depth) const {
    checkDepth(depth);

    Sequence result;
    result.reserve(list.size());
    for (const TagNode& element : list) {
        // Lists of lists are not supported
        if (element.isList()) {
            continue;
        }
        ConfigValue value = decodeNode(element, std::nullopt, nullptr, depth + 1);
        if (value.isNull()) {
            continue;
        }
        result.push_back(std::move(value));
    }
    return ConfigValue(std::move(result));
}

// ============================================================================
// Encode
// ============================================================================

std::optional<TagNode> TagCodec::encode(const ConfigValue& value) const {
    return encodeValue(value, 0);
}

TagCompound TagCodec::encodeSection(const Section& section) const {
    return encodeSectionAt(section, 0);
}

TagCompound TagCodec::encodeObject(const SerializableObject& object) const {
    return encodeObjectAt(object, 0);
}

std::optional<TagNode> TagCodec::encodeValue(const ConfigValue& value, size_t depth) const {
    return std::visit([&](const auto& v) -> std::optional<TagNode> {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            // No boolean tag kind
            return TagNode(static_cast<int8_t>(v ? 1 : 0));
        } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, int16_t> ||
                             std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, float> || std::is_same_v<T, double> ||
                             std::is_same_v<T, std::string>) {
            return TagNode(v);
        } else if constexpr (std::is_same_v<T, ByteArray>) {
            return TagNode(TagByteArray(v));
        } else if constexpr (std::is_same_v<T, IntArray>) {
            return TagNode(TagIntArray(v));
        } else if constexpr (std::is_same_v<T, LongArray>) {
            throw EncodingError("Can't store arrays of long elements");
        } else if constexpr (std::is_same_v<T, DoubleArray>) {
            throw EncodingError("Can't store arrays of double elements");
        } else if constexpr (std::is_same_v<T, Sequence>) {
            return TagNode(encodeSequenceAt(v, depth));
        } else if constexpr (std::is_same_v<T, std::unique_ptr<Section>>) {
            if (!v) {
                return std::nullopt;
            }
            return TagNode(encodeSectionAt(*v, depth));
        } else {
            static_assert(std::is_same_v<T, ObjectRef>, "Unhandled ConfigValue alternative");
            if (!v) {
                return std::nullopt;
            }
            return TagNode(encodeObjectAt(*v, depth));
        }
    }, value.value());
}

TagCompound TagCodec::encodeSectionAt(const Section& section, size_t depth) const {
    checkDepth(depth);

    TagCompound compound;
    for (const auto& [key, value] : section) {
        if (auto node = encodeValue(value, depth + 1)) {
            compound.set(key, std::move(*node));
        }
    }
    return compound;
}

TagList TagCodec::encodeSequenceAt(const Sequence& sequence, size_t depth) const {
    checkDepth(depth);

    TagList list;
    for (size_t i = 0; i < sequence.size(); ++i) {
        const ConfigValue& element = sequence[i];
        // Lists of lists are not supported
        if (element.as<Sequence>()) {
            continue;
        }
        auto node = encodeValue(element, depth + 1);
        if (!node) {
            continue;
        }
        if (!list.empty() && node->type() != list.elementType()) {
            throw EncodingError("Sequence element " + std::to_string(i) + " is " +
                                tagTypeName(node->type()) + ", expected " +
                                tagTypeName(list.elementType()));
        }
        list.add(std::move(*node));
    }
    return list;
}

TagCompound TagCodec::encodeObjectAt(const SerializableObject& object, size_t depth) const {
    checkDepth(depth);

    auto alias = registry_.aliasFor(object);
    if (!alias) {
        throw EncodingError(std::string("Can't store objects of type ") + typeid(object).name());
    }

    TagCompound compound;
    compound.set(MARKER_KEY, TagNode(*alias));

    Section exported = object.serialize();
    for (const auto& [key, value] : exported) {
        if (key == MARKER_KEY) {
            throw EncodingError("Object of type " + *alias + " exports the reserved marker key");
        }
        if (auto node = encodeValue(value, depth + 1)) {
            compound.set(key, std::move(*node));
        }
    }
    return compound;
}

// ============================================================================
// Objects from config maps
// ============================================================================

ObjectRef TagCodec::decodeObject(const Section& section) const {
    const ConfigValue* marker = section.getRaw(MARKER_KEY);
    const std::string* alias = marker ? marker->as<std::string>() : nullptr;
    if (!alias) {
        throw DeserializationError("Section carries no serialized type marker");
    }

    Section payload;
    for (const auto& [key, value] : section) {
        if (key == MARKER_KEY) {
            continue;
        }
        payload.set(key, value.clone());
    }

    return registry_.deserialize(*alias, payload);
}

}  // namespace tagmap
