#pragma once

/**
 * @file serializable.hpp
 * @brief Capability interface for objects stored inside custom data
 *
 * An object type participates by implementing serialize() and registering
 * a factory under an alias with ObjectRegistry. On encode its exported
 * pairs are written next to the marker key; on decode the factory gets
 * the same pairs back.
 *
 * Usage:
 * ```cpp
 * class Waypoint : public SerializableObject {
 * public:
 *     Section serialize() const override;
 *     static std::shared_ptr<Waypoint> deserialize(const Section& data);
 * };
 *
 * registry.registerType<Waypoint>("Waypoint");
 * ```
 */

#include "tagmap/section.hpp"

namespace tagmap {

class SerializableObject {
public:
    virtual ~SerializableObject() = default;

    /// Export this object's state. Must not contain the marker key.
    [[nodiscard]] virtual Section serialize() const = 0;

    /// Structural equality; default compares dynamic type and serialized state
    [[nodiscard]] virtual bool equals(const SerializableObject& other) const;
};

}  // namespace tagmap
