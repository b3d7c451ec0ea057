#include "tagmap/object_registry.hpp"
#include "tagmap/errors.hpp"

#include <exception>
#include <typeinfo>

namespace tagmap {

void ObjectRegistry::registerType(std::string_view alias, std::type_index type, Factory factory) {
    std::string aliasStr(alias);
    if (factories_.contains(aliasStr)) {
        throw CollisionError("Serialized type alias already registered: " + aliasStr, aliasStr);
    }
    if (auto it = aliasesByType_.find(type); it != aliasesByType_.end()) {
        throw CollisionError("Type " + std::string(type.name()) + " already registered as " +
                             it->second, aliasStr);
    }

    factories_.emplace(aliasStr, std::move(factory));
    aliasesByType_.emplace(type, aliasStr);
    order_.push_back(std::move(aliasStr));
}

std::optional<std::string> ObjectRegistry::aliasFor(const SerializableObject& obj) const {
    auto it = aliasesByType_.find(std::type_index(typeid(obj)));
    if (it == aliasesByType_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ObjectRef ObjectRegistry::deserialize(const std::string& alias, const Section& data) const {
    auto it = factories_.find(alias);
    if (it == factories_.end()) {
        throw UnknownTypeError(alias);
    }

    ObjectRef result;
    try {
        result = it->second(data);
    } catch (const std::exception& e) {
        throw RehydrationError(alias, e.what(), std::current_exception());
    } catch (...) {
        throw RehydrationError(alias, "unknown error", std::current_exception());
    }

    if (!result) {
        throw RehydrationError(alias, "factory returned no object");
    }
    return result;
}

bool ObjectRegistry::contains(std::string_view alias) const {
    return factories_.contains(std::string(alias));
}

}  // namespace tagmap
