#include "tagmap/serializable.hpp"

#include <typeinfo>

namespace tagmap {

bool SerializableObject::equals(const SerializableObject& other) const {
    if (typeid(*this) != typeid(other)) {
        return false;
    }
    return serialize() == other.serialize();
}

}  // namespace tagmap
