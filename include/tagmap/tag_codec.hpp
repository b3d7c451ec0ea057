#pragma once

/**
 * @file tag_codec.hpp
 * @brief Node-by-node conversion between tag trees and config maps
 *
 * decode: TagNode -> ConfigValue
 *   - compound with marker key  -> rehydrated object (via ObjectRegistry)
 *   - compound with parent      -> Section linked under parent at key
 *   - compound without parent   -> detached Section
 *   - list                      -> Sequence (nested lists dropped)
 *   - primitives / arrays       -> same kind, same width
 *
 * encode: ConfigValue -> TagNode (nullopt means "remove this key")
 *   - null                      -> nullopt
 *   - Section                   -> Compound (null members omitted)
 *   - Sequence                  -> homogeneous List (nested sequences dropped)
 *   - bool                      -> Byte 0/1
 *   - byte/int arrays           -> ByteArray / IntArray
 *   - long/double arrays        -> EncodingError
 *   - object                    -> Compound tagged with the marker key
 *
 * A failing subtree aborts the whole call; nothing is written anywhere.
 * Nesting deeper than CodecOptions::maxDepth throws StructureTooDeepError.
 */

#include "tagmap/object_registry.hpp"
#include "tagmap/section.hpp"
#include "tagmap/tag_node.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace tagmap {

struct CodecOptions {
    size_t maxDepth = 512;      ///< Maximum container nesting in either direction
};

class TagCodec {
public:
    explicit TagCodec(const ObjectRegistry& registry, CodecOptions options = {});

    // ========================================================================
    // Tag tree -> config map
    // ========================================================================

    /**
     * @brief Convert a tag node into a config value
     *
     * When both key and parent are given, a plain compound becomes a Section
     * linked under parent (parent() and path() report its location). The
     * section is returned, not inserted: store it with parent->set(key, ...).
     * parent itself is never modified, so a failed decode leaves it intact.
     *
     * Until it is stored, the returned section only points at parent; it is
     * not owned by it. Store it (or drop it) before parent is destroyed or
     * moved, otherwise its parent() and path() refer to a dead section.
     *
     * @param node Node to convert, nullptr yields null
     * @param key Key the result will be stored under
     * @param parent Section the result will be stored in
     */
    [[nodiscard]] ConfigValue decode(const TagNode* node,
                                     std::optional<std::string_view> key = std::nullopt,
                                     Section* parent = nullptr) const;

    /// Decode every member of a compound into a fresh detached section
    [[nodiscard]] std::unique_ptr<Section> decodeCompound(const TagCompound& compound) const;

    // ========================================================================
    // Config map -> tag tree
    // ========================================================================

    /// Convert a config value, nullopt for null
    [[nodiscard]] std::optional<TagNode> encode(const ConfigValue& value) const;

    /// Encode every member of a section into a compound
    [[nodiscard]] TagCompound encodeSection(const Section& section) const;

    // ========================================================================
    // Serialized objects
    // ========================================================================

    /// Marker key mapped to the object's alias, followed by its exported pairs
    [[nodiscard]] TagCompound encodeObject(const SerializableObject& object) const;

    /// Rehydrate from a section carrying the marker key
    [[nodiscard]] ObjectRef decodeObject(const Section& section) const;

    [[nodiscard]] const CodecOptions& options() const { return options_; }

private:
    ConfigValue decodeNode(const TagNode& node, std::optional<std::string_view> key,
                           Section* parent, size_t depth) const;
    ConfigValue decodeCompoundNode(const TagCompound& compound, std::optional<std::string_view> key,
                                   Section* parent, size_t depth) const;
    ConfigValue decodeListNode(const TagList& list, size_t depth) const;
    ObjectRef decodeSerialized(const TagCompound& compound, size_t depth) const;

    std::optional<TagNode> encodeValue(const ConfigValue& value, size_t depth) const;
    TagCompound encodeSectionAt(const Section& section, size_t depth) const;
    TagList encodeSequenceAt(const Sequence& sequence, size_t depth) const;
    TagCompound encodeObjectAt(const SerializableObject& object, size_t depth) const;

    void checkDepth(size_t depth) const;

    const ObjectRegistry& registry_;
    CodecOptions options_;
};

}  // namespace tagmap
