#pragma once

/**
 * @file item_data.hpp
 * @brief Custom-data holder at the boundary to the typed item model
 *
 * The typed model (display name, enchantments, ...) lives elsewhere; this
 * class is the piece it delegates to for everything it does not recognise.
 * Custom data is created lazily: an item without custom keys carries no
 * CustomData at all until customData() is called.
 */

#include "tagmap/custom_data.hpp"
#include "tagmap/reserved_keys.hpp"
#include "tagmap/section.hpp"
#include "tagmap/tag_codec.hpp"
#include "tagmap/tag_node.hpp"

#include <memory>

namespace tagmap {

class ItemData {
public:
    /// An item with no custom data
    ItemData(const TagCodec& codec, const ReservedKeys& reserved);

    ItemData(ItemData&&) noexcept = default;
    ItemData& operator=(ItemData&&) noexcept = default;
    ItemData(const ItemData&) = delete;
    ItemData& operator=(const ItemData&) = delete;

    /**
     * @brief Load custom data from an item tag
     *
     * A custom block that fails to decode is logged and dropped; the item
     * itself still loads, just without custom data.
     */
    [[nodiscard]] static ItemData fromTag(const TagCompound& itemTag, const TagCodec& codec,
                                          const ReservedKeys& reserved);

    /// Load custom data from a serialized config map
    [[nodiscard]] static ItemData fromMap(const Section& map, const TagCodec& codec,
                                          const ReservedKeys& reserved);

    /// Deep copy
    [[nodiscard]] ItemData clone() const;

    /// True if there is at least one custom key
    [[nodiscard]] bool hasCustomData() const;

    /// Read/write access to custom data, initialising it if absent.
    /// The reference is invalidated by moving or destroying this ItemData.
    [[nodiscard]] CustomData& customData();

    /// Existing custom data, nullptr if none was ever created
    [[nodiscard]] const CustomData* findCustomData() const { return custom_.get(); }

    /// Drop all custom data
    void clearCustomData() { custom_.reset(); }

    /// Write custom data into an item tag (reserved keys are protected).
    /// @throws CollisionError, EncodingError, StructureTooDeepError
    void applyTo(TagCompound& itemTag) const;

    /// Append custom data to a serialized config map
    void serialize(Section& out) const;

    /// Empty and absent custom data compare equal
    bool operator==(const ItemData& other) const;
    bool operator!=(const ItemData& other) const { return !(*this == other); }

private:
    const TagCodec* codec_;
    const ReservedKeys* reserved_;
    std::unique_ptr<CustomData> custom_;
};

}  // namespace tagmap
