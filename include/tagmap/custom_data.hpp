#pragma once

/**
 * @file custom_data.hpp
 * @brief The custom-data subset of an item's tag tree or config map
 *
 * Custom data is everything the typed item model does not recognise. It is
 * kept as an opaque Section so it survives round trips untouched.
 *
 * The backing Section is owned here and handed out by reference; edits are
 * visible immediately, there is no commit step. Do not hold on to the
 * reference across a mutation of the owning item, and do not share one
 * CustomData between threads without external synchronisation.
 */

#include "tagmap/reserved_keys.hpp"
#include "tagmap/section.hpp"
#include "tagmap/tag_codec.hpp"
#include "tagmap/tag_node.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tagmap {

class CustomData {
public:
    CustomData() = default;
    explicit CustomData(Section data) : data_(std::move(data)) {}

    CustomData(CustomData&&) noexcept = default;
    CustomData& operator=(CustomData&&) noexcept = default;
    CustomData(const CustomData&) = delete;
    CustomData& operator=(const CustomData&) = delete;

    [[nodiscard]] std::unique_ptr<CustomData> clone() const;

    // ========================================================================
    // Extraction
    // ========================================================================

    /**
     * @brief Collect the custom keys of an item tag
     *
     * Tag-namespace reserved names are skipped. If nothing is left this
     * returns nullptr and allocates nothing.
     *
     * @throws TagMapError subclasses if any custom value fails to decode
     */
    [[nodiscard]] static std::unique_ptr<CustomData> fromTag(const TagCompound& tag,
                                                             const ReservedKeys& reserved,
                                                             const TagCodec& codec);

    /// Decode every key of tag, unfiltered (nullptr if tag is empty)
    [[nodiscard]] static std::unique_ptr<CustomData> fromTagAll(const TagCompound& tag,
                                                                const TagCodec& codec);

    /**
     * @brief Collect the custom keys of a config map
     *
     * Skips reserved names of both namespaces and the marker key, which
     * belongs to the enclosing serialized-object envelope. Values are deep
     * copied. Returns nullptr if nothing is left.
     */
    [[nodiscard]] static std::unique_ptr<CustomData> fromMap(const Section& map,
                                                             const ReservedKeys& reserved);

    /// Deep copy every key of map, unfiltered (nullptr if map is empty)
    [[nodiscard]] static std::unique_ptr<CustomData> fromMapAll(const Section& map);

    // ========================================================================
    // Write-back
    // ========================================================================

    /**
     * @brief Write every custom key into tree
     *
     * Values that encode to nothing remove the key from tree. All values are
     * encoded before tree is touched, so on any error tree is unchanged.
     *
     * @throws CollisionError if filterReserved and a key is a reserved tag name
     */
    void applyToTree(TagCompound& tree, bool filterReserved,
                     const ReservedKeys& reserved, const TagCodec& codec) const;

    /// applyToTree with the reserved-key guard on
    void applyToItem(TagCompound& itemTag, const ReservedKeys& reserved,
                     const TagCodec& codec) const {
        applyToTree(itemTag, true, reserved, codec);
    }

    /// applyToTree without filtering, for nested or non-item tags
    void applyToTag(TagCompound& tag, const TagCodec& codec) const;

    /// Deep copy every entry into out (item -> config map serialization)
    void serializeInto(Section& out) const;

    // ========================================================================
    // Access
    // ========================================================================

    [[nodiscard]] Section& section() { return data_; }
    [[nodiscard]] const Section& section() const { return data_; }

    [[nodiscard]] bool isEmpty() const { return data_.empty(); }

    bool operator==(const CustomData& other) const { return data_ == other.data_; }
    bool operator!=(const CustomData& other) const { return !(*this == other); }

    [[nodiscard]] size_t hash() const { return data_.hash(); }

private:
    static std::unique_ptr<CustomData> decodeKeys(const TagCompound& tag,
                                                  const std::vector<std::string>& keys,
                                                  const TagCodec& codec);
    static std::unique_ptr<CustomData> copyKeys(const Section& map,
                                                const std::vector<std::string>& keys);

    Section data_;
};

}  // namespace tagmap

template<>
struct std::hash<tagmap::CustomData> {
    size_t operator()(const tagmap::CustomData& data) const noexcept {
        return data.hash();
    }
};
