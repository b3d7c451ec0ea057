#pragma once

/**
 * @file section.hpp
 * @brief Config-map values and the insertion-ordered keyed Section
 *
 * ConfigValue is the human-editable side of the conversion. Unlike TagNode
 * it keeps bools, null, and array element types the tag format cannot
 * carry, so encode() has to reject some of them.
 *
 * Both types are move-only (sections own their children); use clone() for
 * a deep copy. Serialized objects are shared, not copied, by clone().
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tagmap {

class Section;
class SerializableObject;

using ByteArray = std::vector<int8_t>;
using IntArray = std::vector<int32_t>;
using LongArray = std::vector<int64_t>;
using DoubleArray = std::vector<double>;
using ObjectRef = std::shared_ptr<SerializableObject>;

class ConfigValue;
using Sequence = std::vector<ConfigValue>;

// ============================================================================
// ConfigValue
// ============================================================================

class ConfigValue {
public:
    // Alternatives, in order:
    // - monostate: null (setting null on a Section removes the key)
    // - bool
    // - int8_t .. int64_t: exact width is preserved through the tag tree
    // - float, double
    // - string
    // - ByteArray, IntArray: map onto the tag array kinds
    // - LongArray, DoubleArray: config-only, rejected by encode()
    // - Sequence: ordered values
    // - unique_ptr<Section>: nested keyed data
    // - ObjectRef: a rehydrated registered object
    using Value = std::variant<
        std::monostate,
        bool,
        int8_t,
        int16_t,
        int32_t,
        int64_t,
        float,
        double,
        std::string,
        ByteArray,
        IntArray,
        LongArray,
        DoubleArray,
        Sequence,
        std::unique_ptr<Section>,
        ObjectRef
    >;

    ConfigValue();
    ConfigValue(bool v);
    ConfigValue(int8_t v);
    ConfigValue(int16_t v);
    ConfigValue(int32_t v);
    ConfigValue(int64_t v);
    ConfigValue(float v);
    ConfigValue(double v);
    ConfigValue(std::string v);
    ConfigValue(std::string_view v);
    ConfigValue(const char* v);
    ConfigValue(ByteArray v);
    ConfigValue(IntArray v);
    ConfigValue(LongArray v);
    ConfigValue(DoubleArray v);
    ConfigValue(Sequence v);
    ConfigValue(std::unique_ptr<Section> v);
    ConfigValue(ObjectRef v);

    template<typename T, typename = std::enable_if_t<std::is_base_of_v<SerializableObject, T> &&
                                                     !std::is_same_v<T, SerializableObject>>>
    ConfigValue(std::shared_ptr<T> v) : ConfigValue(ObjectRef(std::move(v))) {}

    ~ConfigValue();
    ConfigValue(ConfigValue&&) noexcept;
    ConfigValue& operator=(ConfigValue&&) noexcept;
    ConfigValue(const ConfigValue&) = delete;
    ConfigValue& operator=(const ConfigValue&) = delete;

    /// Deep copy (sections are cloned detached, objects are shared)
    [[nodiscard]] ConfigValue clone() const;

    [[nodiscard]] bool isNull() const { return std::holds_alternative<std::monostate>(value_); }

    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&value_); }

    template<typename T>
    [[nodiscard]] T* as() { return std::get_if<T>(&value_); }

    /// Nested section, or nullptr if this is not a section
    [[nodiscard]] Section* section() const;

    /// Serialized object, or nullptr if this is not an object
    [[nodiscard]] const SerializableObject* object() const;

    /// Short kind name for diagnostics ("Int", "Sequence", "Section", ...)
    [[nodiscard]] const char* kindName() const;

    [[nodiscard]] const Value& value() const { return value_; }
    [[nodiscard]] Value& value() { return value_; }

    /// Structural equality (sections compare by content, not identity)
    bool operator==(const ConfigValue& other) const;
    bool operator!=(const ConfigValue& other) const { return !(*this == other); }

    [[nodiscard]] size_t hash() const;

private:
    Value value_;
};

// ============================================================================
// Section - insertion-ordered keyed map with optional parent linkage
// ============================================================================
//
// A section created through createSection() (or adopted by set()) knows its
// parent and name, so path() can report where it lives. Sections built on
// their own are detached roots.
//
// Equality and hashing are structural and ignore both linkage and member
// order.
//
class Section {
public:
    using Entry = std::pair<std::string, ConfigValue>;

    Section();
    ~Section();

    // Move-only; moving re-links direct children to the new address
    Section(Section&& other) noexcept;
    Section& operator=(Section&& other) noexcept;
    Section(const Section&) = delete;
    Section& operator=(const Section&) = delete;

    /// Deep copy, detached from any parent
    [[nodiscard]] std::unique_ptr<Section> clone() const;

    // ========================================================================
    // Access
    // ========================================================================

    /// Set a value; a null value removes the key. Sections are adopted.
    void set(std::string_view key, ConfigValue value);

    /// Raw value, nullptr if absent
    [[nodiscard]] const ConfigValue* getRaw(std::string_view key) const;
    [[nodiscard]] ConfigValue* getRaw(std::string_view key);

    /// Typed read with default fallback.
    /// Returns defaultValue if the key doesn't exist or the kind doesn't fit.
    /// Integers of any width satisfy integral T when the value fits in T
    /// (an out-of-range value returns defaultValue); integers and floats
    /// satisfy floating-point T.
    template<typename T>
    [[nodiscard]] T get(std::string_view key, T defaultValue = T{}) const;

    /// Child section, nullptr if absent or not a section
    [[nodiscard]] Section* getSection(std::string_view key) const;

    /// Create (or replace) a live child section under key
    Section& createSection(std::string_view key);

    [[nodiscard]] bool contains(std::string_view key) const;
    bool remove(std::string_view key);

    /// Keys in insertion order
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    [[nodiscard]] auto begin() const { return entries_.cbegin(); }
    [[nodiscard]] auto end() const { return entries_.cend(); }

    // ========================================================================
    // Linkage
    // ========================================================================

    [[nodiscard]] Section* parent() const { return parent_; }
    [[nodiscard]] const std::string& name() const { return name_; }

    /// Dotted path from the root ("" for a root section)
    [[nodiscard]] std::string path() const;

    // ========================================================================
    // Structural comparison
    // ========================================================================

    bool operator==(const Section& other) const;
    bool operator!=(const Section& other) const { return !(*this == other); }

    [[nodiscard]] size_t hash() const;

private:
    friend class TagCodec;

    void adopt(std::string_view key, ConfigValue& value);
    void relinkChildren();

    // Record linkage without inserting into parent
    void linkUnder(Section& parent, std::string_view name) {
        parent_ = &parent;
        name_ = std::string(name);
    }

    Section* parent_ = nullptr;
    std::string name_;
    std::vector<Entry> entries_;
};

// ============================================================================
// Template implementations
// ============================================================================

template<typename T>
T Section::get(std::string_view key, T defaultValue) const {
    const ConfigValue* raw = getRaw(key);
    if (!raw) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, bool>) {
        if (auto* val = raw->as<bool>()) {
            return *val;
        }
    } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
        // Widen or narrow across the integer family (and into floats)
        bool matched = false;
        T result = defaultValue;
        std::visit([&](const auto& v) {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_integral_v<V> && !std::is_same_v<V, bool>) {
                if constexpr (std::is_integral_v<T>) {
                    // Out of range for T: fall back instead of wrapping
                    if (!std::in_range<T>(v)) {
                        return;
                    }
                }
                result = static_cast<T>(v);
                matched = true;
            } else if constexpr (std::is_floating_point_v<V> && std::is_floating_point_v<T>) {
                result = static_cast<T>(v);
                matched = true;
            }
        }, raw->value());
        if (matched) {
            return result;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (auto* val = raw->as<std::string>()) {
            return *val;
        }
    } else if constexpr (std::is_same_v<T, ByteArray> || std::is_same_v<T, IntArray> ||
                         std::is_same_v<T, LongArray> || std::is_same_v<T, DoubleArray> ||
                         std::is_same_v<T, ObjectRef>) {
        if (auto* val = raw->as<T>()) {
            return *val;
        }
    } else {
        static_assert(sizeof(T) == 0, "Unsupported type for Section::get");
    }

    return defaultValue;
}

}  // namespace tagmap

template<>
struct std::hash<tagmap::Section> {
    size_t operator()(const tagmap::Section& section) const noexcept {
        return section.hash();
    }
};
