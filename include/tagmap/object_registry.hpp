#pragma once

/**
 * @file object_registry.hpp
 * @brief Alias -> factory registration for serializable object types
 *
 * The registry is an owned object built once at startup and passed by
 * reference to every TagCodec. Registration must finish before any decode
 * runs concurrently; after that, lookups are read-only and take no locks.
 *
 * Each alias maps to exactly one factory and each C++ type to exactly one
 * alias. Violations throw CollisionError at registration time.
 */

#include "tagmap/section.hpp"
#include "tagmap/serializable.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace tagmap {

class ObjectRegistry {
public:
    using Factory = std::function<ObjectRef(const Section&)>;

    ObjectRegistry() = default;

    // Non-copyable (codecs hold references)
    ObjectRegistry(const ObjectRegistry&) = delete;
    ObjectRegistry& operator=(const ObjectRegistry&) = delete;

    /// Register a factory for alias, produced objects have dynamic type `type`.
    /// @throws CollisionError if the alias or the type is already registered
    void registerType(std::string_view alias, std::type_index type, Factory factory);

    /// Register T, which must provide `static std::shared_ptr<T> deserialize(const Section&)`
    template<typename T>
    void registerType(std::string_view alias) {
        registerType(alias, std::type_index(typeid(T)),
                     [](const Section& data) -> ObjectRef { return T::deserialize(data); });
    }

    /// Alias registered for the dynamic type of obj, nullopt if none
    [[nodiscard]] std::optional<std::string> aliasFor(const SerializableObject& obj) const;

    /// Rehydrate an object.
    /// @throws UnknownTypeError if alias is not registered
    /// @throws RehydrationError if the factory throws or returns null
    [[nodiscard]] ObjectRef deserialize(const std::string& alias, const Section& data) const;

    [[nodiscard]] bool contains(std::string_view alias) const;
    [[nodiscard]] size_t size() const { return factories_.size(); }

    /// Registered aliases in registration order
    [[nodiscard]] const std::vector<std::string>& aliases() const { return order_; }

private:
    std::unordered_map<std::string, Factory> factories_;
    std::unordered_map<std::type_index, std::string> aliasesByType_;
    std::vector<std::string> order_;
};

}  // namespace tagmap
