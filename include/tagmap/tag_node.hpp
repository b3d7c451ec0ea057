#pragma once

/**
 * @file tag_node.hpp
 * @brief In-memory tag tree: typed leaves, homogeneous lists, compounds
 *
 * This is the shape handed over by the persistence/network layer. tagmap
 * never reads or writes the binary encoding itself; it only walks these
 * nodes.
 *
 * Type numbering follows the classic tag format so that element types
 * recorded on lists can be compared against external data directly.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tagmap {

enum class TagType : uint8_t {
    End = 0,        ///< Element type of an empty list
    Byte = 1,
    Short = 2,
    Int = 3,
    Long = 4,
    Float = 5,
    Double = 6,
    ByteArray = 7,
    String = 8,
    List = 9,
    Compound = 10,
    IntArray = 11,
};

/// Human-readable name for error messages ("Int", "Compound", ...)
[[nodiscard]] const char* tagTypeName(TagType type);

using TagByteArray = std::vector<int8_t>;
using TagIntArray = std::vector<int32_t>;

class TagNode;

// ============================================================================
// TagList - homogeneous ordered list
// ============================================================================
//
// The element type is recorded once, on the first add(). Adding an element
// of a different type throws StructuralError naming the offending index.
//
class TagList {
public:
    TagList();
    ~TagList();
    TagList(const TagList&);
    TagList(TagList&&) noexcept;
    TagList& operator=(const TagList&);
    TagList& operator=(TagList&&) noexcept;

    /// Element type (End while the list is empty)
    [[nodiscard]] TagType elementType() const { return elementType_; }

    void add(TagNode node);

    [[nodiscard]] const TagNode& at(size_t index) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    void clear();

    [[nodiscard]] std::vector<TagNode>::const_iterator begin() const;
    [[nodiscard]] std::vector<TagNode>::const_iterator end() const;

    bool operator==(const TagList& other) const;

private:
    TagType elementType_ = TagType::End;
    std::vector<TagNode> elements_;
};

// ============================================================================
// TagCompound - insertion-ordered string -> TagNode map
// ============================================================================

class TagCompound {
public:
    using Entry = std::pair<std::string, TagNode>;

    TagCompound();
    ~TagCompound();
    TagCompound(const TagCompound&);
    TagCompound(TagCompound&&) noexcept;
    TagCompound& operator=(const TagCompound&);
    TagCompound& operator=(TagCompound&&) noexcept;

    /// Overwrite in place if the key exists, else append
    void set(std::string_view key, TagNode node);

    /// Returns nullptr if the key is absent
    [[nodiscard]] const TagNode* get(std::string_view key) const;
    [[nodiscard]] TagNode* get(std::string_view key);

    [[nodiscard]] bool contains(std::string_view key) const;

    /// Returns true if a key was removed
    bool remove(std::string_view key);

    /// Keys in insertion order
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    void clear();

    [[nodiscard]] std::vector<Entry>::const_iterator begin() const;
    [[nodiscard]] std::vector<Entry>::const_iterator end() const;

    /// Member order is not significant for equality
    bool operator==(const TagCompound& other) const;

private:
    std::vector<Entry> entries_;
};

// ============================================================================
// TagNode - tagged union over every tag kind
// ============================================================================

class TagNode {
public:
    using Value = std::variant<
        int8_t,
        int16_t,
        int32_t,
        int64_t,
        float,
        double,
        std::string,
        TagByteArray,
        TagIntArray,
        TagList,
        TagCompound
    >;

    TagNode(int8_t v) : value_(v) {}
    TagNode(int16_t v) : value_(v) {}
    TagNode(int32_t v) : value_(v) {}
    TagNode(int64_t v) : value_(v) {}
    TagNode(float v) : value_(v) {}
    TagNode(double v) : value_(v) {}
    TagNode(std::string v) : value_(std::move(v)) {}
    TagNode(const char* v) : value_(std::string(v)) {}
    TagNode(TagByteArray v) : value_(std::move(v)) {}
    TagNode(TagIntArray v) : value_(std::move(v)) {}
    TagNode(TagList v) : value_(std::move(v)) {}
    TagNode(TagCompound v) : value_(std::move(v)) {}

    [[nodiscard]] TagType type() const;

    /// Typed access, nullptr if the node holds another kind
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&value_); }

    template<typename T>
    [[nodiscard]] T* as() { return std::get_if<T>(&value_); }

    [[nodiscard]] bool isList() const { return type() == TagType::List; }

    [[nodiscard]] const Value& value() const { return value_; }

    bool operator==(const TagNode& other) const { return value_ == other.value_; }

private:
    Value value_;
};

}  // namespace tagmap
