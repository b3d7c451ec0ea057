#include "tagmap/section.hpp"
#include "tagmap/serializable.hpp"

#include <algorithm>
#include <iterator>

namespace tagmap {

namespace {

void hashCombine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

template<typename Vec>
size_t hashArray(const Vec& values) {
    size_t seed = values.size();
    for (const auto& v : values) {
        hashCombine(seed, std::hash<typename Vec::value_type>{}(v));
    }
    return seed;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

ConfigValue::ConfigValue() = default;
ConfigValue::ConfigValue(bool v) : value_(v) {}
ConfigValue::ConfigValue(int8_t v) : value_(v) {}
ConfigValue::ConfigValue(int16_t v) : value_(v) {}
ConfigValue::ConfigValue(int32_t v) : value_(v) {}
ConfigValue::ConfigValue(int64_t v) : value_(v) {}
ConfigValue::ConfigValue(float v) : value_(v) {}
ConfigValue::ConfigValue(double v) : value_(v) {}
ConfigValue::ConfigValue(std::string v) : value_(std::move(v)) {}
ConfigValue::ConfigValue(std::string_view v) : value_(std::string(v)) {}
ConfigValue::ConfigValue(const char* v) : value_(std::string(v)) {}
ConfigValue::ConfigValue(ByteArray v) : value_(std::move(v)) {}
ConfigValue::ConfigValue(IntArray v) : value_(std::move(v)) {}
ConfigValue::ConfigValue(LongArray v) : value_(std::move(v)) {}
ConfigValue::ConfigValue(DoubleArray v) : value_(std::move(v)) {}
ConfigValue::ConfigValue(Sequence v) : value_(std::move(v)) {}
ConfigValue::ConfigValue(ObjectRef v) : value_(std::move(v)) {}

ConfigValue::ConfigValue(std::unique_ptr<Section> v) {
    // A null section pointer is just null
    if (v) {
        value_ = std::move(v);
    }
}

ConfigValue::~ConfigValue() = default;
ConfigValue::ConfigValue(ConfigValue&&) noexcept = default;
ConfigValue& ConfigValue::operator=(ConfigValue&&) noexcept = default;

ConfigValue ConfigValue::clone() const {
    return std::visit([](const auto& v) -> ConfigValue {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return ConfigValue();
        } else if constexpr (std::is_same_v<T, std::unique_ptr<Section>>) {
            return v ? ConfigValue(v->clone()) : ConfigValue();
        } else if constexpr (std::is_same_v<T, Sequence>) {
            Sequence copy;
            copy.reserve(v.size());
            for (const auto& element : v) {
                copy.push_back(element.clone());
            }
            return ConfigValue(std::move(copy));
        } else {
            // Primitives, arrays and shared objects
            return ConfigValue(v);
        }
    }, value_);
}

Section* ConfigValue::section() const {
    if (auto* ptr = std::get_if<std::unique_ptr<Section>>(&value_)) {
        return ptr->get();
    }
    return nullptr;
}

const SerializableObject* ConfigValue::object() const {
    if (auto* ptr = std::get_if<ObjectRef>(&value_)) {
        return ptr->get();
    }
    return nullptr;
}

const char* ConfigValue::kindName() const {
    static constexpr const char* NAMES[] = {
        "Null", "Bool", "Byte", "Short", "Int", "Long", "Float", "Double", "String",
        "ByteArray", "IntArray", "LongArray", "DoubleArray", "Sequence", "Section", "Object"
    };
    static_assert(std::size(NAMES) == std::variant_size_v<Value>);
    return NAMES[value_.index()];
}

bool ConfigValue::operator==(const ConfigValue& other) const {
    if (value_.index() != other.value_.index()) {
        return false;
    }

    return std::visit([&other](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        const T& theirs = std::get<T>(other.value_);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, std::unique_ptr<Section>>) {
            if (!v || !theirs) return !v && !theirs;
            return *v == *theirs;
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            if (v == theirs) return true;
            if (!v || !theirs) return false;
            return v->equals(*theirs);
        } else {
            return v == theirs;
        }
    }, value_);
}

size_t ConfigValue::hash() const {
    size_t seed = value_.index();

    std::visit([&seed](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            // Index alone
        } else if constexpr (std::is_same_v<T, std::unique_ptr<Section>>) {
            if (v) {
                hashCombine(seed, v->hash());
            }
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            if (v) {
                hashCombine(seed, v->serialize().hash());
            }
        } else if constexpr (std::is_same_v<T, Sequence>) {
            hashCombine(seed, v.size());
            for (const auto& element : v) {
                hashCombine(seed, element.hash());
            }
        } else if constexpr (std::is_same_v<T, ByteArray> || std::is_same_v<T, IntArray> ||
                             std::is_same_v<T, LongArray> || std::is_same_v<T, DoubleArray>) {
            hashCombine(seed, hashArray(v));
        } else {
            hashCombine(seed, std::hash<T>{}(v));
        }
    }, value_);

    return seed;
}

// ============================================================================
// Section
// ============================================================================

Section::Section() = default;
Section::~Section() = default;

Section::Section(Section&& other) noexcept
    : parent_(other.parent_)
    , name_(std::move(other.name_))
    , entries_(std::move(other.entries_)) {
    other.parent_ = nullptr;
    relinkChildren();
}

Section& Section::operator=(Section&& other) noexcept {
    if (this != &other) {
        // Keep our own place in the tree, take the other's contents
        entries_ = std::move(other.entries_);
        relinkChildren();
    }
    return *this;
}

void Section::relinkChildren() {
    for (auto& [key, value] : entries_) {
        if (Section* child = value.section()) {
            child->parent_ = this;
        }
    }
}

std::unique_ptr<Section> Section::clone() const {
    auto result = std::make_unique<Section>();
    for (const auto& [key, value] : entries_) {
        result->set(key, value.clone());
    }
    return result;
}

void Section::adopt(std::string_view key, ConfigValue& value) {
    if (Section* child = value.section()) {
        child->parent_ = this;
        child->name_ = std::string(key);
    }
}

void Section::set(std::string_view key, ConfigValue value) {
    if (value.isNull()) {
        remove(key);
        return;
    }

    adopt(key, value);
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::string(key), std::move(value));
}

const ConfigValue* Section::getRaw(std::string_view key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

ConfigValue* Section::getRaw(std::string_view key) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

Section* Section::getSection(std::string_view key) const {
    const ConfigValue* raw = getRaw(key);
    return raw ? raw->section() : nullptr;
}

Section& Section::createSection(std::string_view key) {
    auto child = std::make_unique<Section>();
    Section& ref = *child;
    set(key, ConfigValue(std::move(child)));
    return ref;
}

bool Section::contains(std::string_view key) const {
    return getRaw(key) != nullptr;
}

bool Section::remove(std::string_view key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [key](const Entry& entry) { return entry.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::vector<std::string> Section::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

std::string Section::path() const {
    if (!parent_) {
        return {};
    }
    std::string parentPath = parent_->path();
    if (parentPath.empty()) {
        return name_;
    }
    return parentPath + "." + name_;
}

bool Section::operator==(const Section& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& [key, value] : entries_) {
        const ConfigValue* theirs = other.getRaw(key);
        if (!theirs || *theirs != value) {
            return false;
        }
    }
    return true;
}

size_t Section::hash() const {
    // Order-independent: sum of per-entry hashes
    size_t result = entries_.size();
    for (const auto& [key, value] : entries_) {
        size_t entryHash = std::hash<std::string>{}(key);
        hashCombine(entryHash, value.hash());
        result += entryHash;
    }
    return result;
}

}  // namespace tagmap
