#pragma once

/**
 * @file reserved_keys.hpp
 * @brief Keys owned by the typed item model, excluded from custom data
 *
 * Two namespaces: names as they appear in the tag tree ("display",
 * "RepairCost") and names as they appear in a config map ("display-name",
 * "repair-cost"). The meta type field is reserved in both. The marker key
 * belongs to the serialized-object envelope and is never custom data.
 */

#include <string>
#include <string_view>
#include <unordered_set>

namespace tagmap {

/// Marker key identifying the serialized form of a registered object
inline constexpr std::string_view MARKER_KEY = "==";

/// Field carrying the item meta type, reserved in both namespaces
inline constexpr std::string_view META_TYPE_FIELD = "meta-type";

class ReservedKeys {
public:
    ReservedKeys() = default;

    /// Well-known item fields
    [[nodiscard]] static ReservedKeys defaults();

    void addTagName(std::string_view name) { tagNames_.emplace(name); }
    void addMapName(std::string_view name) { mapNames_.emplace(name); }

    /// Tag-tree reserved name (or the meta type field)
    [[nodiscard]] bool isReservedTagKey(std::string_view key) const;

    /// Config-map reserved name (or the meta type field)
    [[nodiscard]] bool isReservedMapKey(std::string_view key) const;

    /// Top-level tag key that belongs to custom data
    [[nodiscard]] bool isCustomTagKey(std::string_view key) const {
        return !isReservedTagKey(key);
    }

    /// Top-level config-map key that belongs to custom data.
    /// Tag names are skipped as well so that data written by newer models
    /// under either spelling is never captured as custom.
    [[nodiscard]] bool isCustomMapKey(std::string_view key) const {
        return !isReservedMapKey(key) && !isReservedTagKey(key) && key != MARKER_KEY;
    }

    [[nodiscard]] const std::unordered_set<std::string>& tagNames() const { return tagNames_; }
    [[nodiscard]] const std::unordered_set<std::string>& mapNames() const { return mapNames_; }

private:
    std::unordered_set<std::string> tagNames_;
    std::unordered_set<std::string> mapNames_;
};

}  // namespace tagmap
