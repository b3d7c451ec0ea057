#include "tagmap/custom_data.hpp"
#include "tagmap/errors.hpp"

#include <optional>
#include <utility>

namespace tagmap {

std::unique_ptr<CustomData> CustomData::clone() const {
    return std::make_unique<CustomData>(std::move(*data_.clone()));
}

// ============================================================================
// Extraction
// ============================================================================

std::unique_ptr<CustomData> CustomData::decodeKeys(const TagCompound& tag,
                                                   const std::vector<std::string>& keys,
                                                   const TagCodec& codec) {
    if (keys.empty()) {
        return nullptr;
    }

    auto result = std::make_unique<CustomData>();
    Section& root = result->data_;
    for (const auto& key : keys) {
        root.set(key, codec.decode(tag.get(key), key, &root));
    }
    return result;
}

std::unique_ptr<CustomData> CustomData::copyKeys(const Section& map,
                                                 const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return nullptr;
    }

    auto result = std::make_unique<CustomData>();
    for (const auto& key : keys) {
        if (const ConfigValue* value = map.getRaw(key)) {
            result->data_.set(key, value->clone());
        }
    }
    return result;
}

std::unique_ptr<CustomData> CustomData::fromTag(const TagCompound& tag,
                                                const ReservedKeys& reserved,
                                                const TagCodec& codec) {
    std::vector<std::string> keys;
    for (const auto& [key, node] : tag) {
        if (reserved.isCustomTagKey(key)) {
            keys.push_back(key);
        }
    }
    return decodeKeys(tag, keys, codec);
}

std::unique_ptr<CustomData> CustomData::fromTagAll(const TagCompound& tag, const TagCodec& codec) {
    return decodeKeys(tag, tag.keys(), codec);
}

std::unique_ptr<CustomData> CustomData::fromMap(const Section& map, const ReservedKeys& reserved) {
    std::vector<std::string> keys;
    for (const auto& [key, value] : map) {
        if (reserved.isCustomMapKey(key)) {
            keys.push_back(key);
        }
    }
    return copyKeys(map, keys);
}

std::unique_ptr<CustomData> CustomData::fromMapAll(const Section& map) {
    return copyKeys(map, map.keys());
}

// ============================================================================
// Write-back
// ============================================================================

void CustomData::applyToTree(TagCompound& tree, bool filterReserved,
                             const ReservedKeys& reserved, const TagCodec& codec) const {
    // Stage everything first so a failure leaves tree untouched
    std::vector<std::pair<std::string, std::optional<TagNode>>> staged;
    staged.reserve(data_.size());

    for (const auto& [key, value] : data_) {
        if (filterReserved && reserved.isReservedTagKey(key)) {
            throw CollisionError("Can not customize key: " + key, key);
        }
        staged.emplace_back(key, codec.encode(value));
    }

    for (auto& [key, node] : staged) {
        if (node) {
            tree.set(key, std::move(*node));
        } else {
            tree.remove(key);
        }
    }
}

void CustomData::applyToTag(TagCompound& tag, const TagCodec& codec) const {
    applyToTree(tag, false, ReservedKeys{}, codec);
}

void CustomData::serializeInto(Section& out) const {
    for (const auto& [key, value] : data_) {
        out.set(key, value.clone());
    }
}

}  // namespace tagmap
