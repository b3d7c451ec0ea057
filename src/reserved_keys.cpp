#include "tagmap/reserved_keys.hpp"

namespace tagmap {

ReservedKeys ReservedKeys::defaults() {
    ReservedKeys keys;

    for (std::string_view name : {"display", "Enchantments", "RepairCost", "AttributeModifiers",
                                  "Unbreakable", "HideFlags", "Damage", "CustomModelData",
                                  "CanDestroy", "CanPlaceOn", "BlockEntityTag"}) {
        keys.addTagName(name);
    }

    for (std::string_view name : {"display-name", "lore", "enchants", "repair-cost",
                                  "attribute-modifiers", "ItemFlags", "Unbreakable", "Damage",
                                  "custom-model-data", "internal"}) {
        keys.addMapName(name);
    }

    return keys;
}

bool ReservedKeys::isReservedTagKey(std::string_view key) const {
    if (key == META_TYPE_FIELD) {
        return true;
    }
    return tagNames_.contains(std::string(key));
}

bool ReservedKeys::isReservedMapKey(std::string_view key) const {
    if (key == META_TYPE_FIELD) {
        return true;
    }
    return mapNames_.contains(std::string(key));
}

}  // namespace tagmap
