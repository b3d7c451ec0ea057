#include "tagmap/item_data.hpp"
#include "tagmap/errors.hpp"

#include <iostream>

namespace tagmap {

ItemData::ItemData(const TagCodec& codec, const ReservedKeys& reserved)
    : codec_(&codec)
    , reserved_(&reserved) {}

ItemData ItemData::fromTag(const TagCompound& itemTag, const TagCodec& codec,
                           const ReservedKeys& reserved) {
    ItemData item(codec, reserved);
    try {
        item.custom_ = CustomData::fromTag(itemTag, reserved, codec);
    } catch (const TagMapError& e) {
        std::cerr << "[ItemData] Discarding custom data: " << e.what() << '\n';
    }
    return item;
}

ItemData ItemData::fromMap(const Section& map, const TagCodec& codec,
                           const ReservedKeys& reserved) {
    ItemData item(codec, reserved);
    item.custom_ = CustomData::fromMap(map, reserved);
    return item;
}

ItemData ItemData::clone() const {
    ItemData copy(*codec_, *reserved_);
    if (custom_) {
        copy.custom_ = custom_->clone();
    }
    return copy;
}

bool ItemData::hasCustomData() const {
    return custom_ && !custom_->isEmpty();
}

CustomData& ItemData::customData() {
    if (!custom_) {
        custom_ = std::make_unique<CustomData>();
    }
    return *custom_;
}

void ItemData::applyTo(TagCompound& itemTag) const {
    if (custom_) {
        custom_->applyToItem(itemTag, *reserved_, *codec_);
    }
}

void ItemData::serialize(Section& out) const {
    if (custom_) {
        custom_->serializeInto(out);
    }
}

bool ItemData::operator==(const ItemData& other) const {
    bool mine = hasCustomData();
    bool theirs = other.hasCustomData();
    if (!mine || !theirs) {
        return mine == theirs;
    }
    return *custom_ == *other.custom_;
}

}  // namespace tagmap
