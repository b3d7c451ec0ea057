#include "tagmap/tag_node.hpp"
#include "tagmap/errors.hpp"

#include <algorithm>
#include <string>
#include <type_traits>

namespace tagmap {

const char* tagTypeName(TagType type) {
    switch (type) {
        case TagType::End:       return "End";
        case TagType::Byte:      return "Byte";
        case TagType::Short:     return "Short";
        case TagType::Int:       return "Int";
        case TagType::Long:      return "Long";
        case TagType::Float:     return "Float";
        case TagType::Double:    return "Double";
        case TagType::ByteArray: return "ByteArray";
        case TagType::String:    return "String";
        case TagType::List:      return "List";
        case TagType::Compound:  return "Compound";
        case TagType::IntArray:  return "IntArray";
    }
    return "Unknown";
}

// ============================================================================
// TagList
// ============================================================================

TagList::TagList() = default;
TagList::~TagList() = default;
TagList::TagList(const TagList&) = default;
TagList::TagList(TagList&&) noexcept = default;
TagList& TagList::operator=(const TagList&) = default;
TagList& TagList::operator=(TagList&&) noexcept = default;

void TagList::add(TagNode node) {
    TagType type = node.type();
    if (elements_.empty()) {
        elementType_ = type;
    } else if (type != elementType_) {
        throw StructuralError("List element " + std::to_string(elements_.size()) +
                              " is " + tagTypeName(type) + ", list holds " +
                              tagTypeName(elementType_));
    }
    elements_.push_back(std::move(node));
}

const TagNode& TagList::at(size_t index) const {
    return elements_.at(index);
}

size_t TagList::size() const {
    return elements_.size();
}

bool TagList::empty() const {
    return elements_.empty();
}

void TagList::clear() {
    elements_.clear();
    elementType_ = TagType::End;
}

std::vector<TagNode>::const_iterator TagList::begin() const {
    return elements_.begin();
}

std::vector<TagNode>::const_iterator TagList::end() const {
    return elements_.end();
}

bool TagList::operator==(const TagList& other) const {
    return elementType_ == other.elementType_ && elements_ == other.elements_;
}

// ============================================================================
// TagCompound
// ============================================================================

TagCompound::TagCompound() = default;
TagCompound::~TagCompound() = default;
TagCompound::TagCompound(const TagCompound&) = default;
TagCompound::TagCompound(TagCompound&&) noexcept = default;
TagCompound& TagCompound::operator=(const TagCompound&) = default;
TagCompound& TagCompound::operator=(TagCompound&&) noexcept = default;

void TagCompound::set(std::string_view key, TagNode node) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(node);
            return;
        }
    }
    entries_.emplace_back(std::string(key), std::move(node));
}

const TagNode* TagCompound::get(std::string_view key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

TagNode* TagCompound::get(std::string_view key) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

bool TagCompound::contains(std::string_view key) const {
    return get(key) != nullptr;
}

bool TagCompound::remove(std::string_view key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [key](const Entry& entry) { return entry.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::vector<std::string> TagCompound::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t TagCompound::size() const {
    return entries_.size();
}

bool TagCompound::empty() const {
    return entries_.empty();
}

void TagCompound::clear() {
    entries_.clear();
}

std::vector<TagCompound::Entry>::const_iterator TagCompound::begin() const {
    return entries_.begin();
}

std::vector<TagCompound::Entry>::const_iterator TagCompound::end() const {
    return entries_.end();
}

bool TagCompound::operator==(const TagCompound& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& [key, node] : entries_) {
        const TagNode* theirs = other.get(key);
        if (!theirs || !(*theirs == node)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// TagNode
// ============================================================================

TagType TagNode::type() const {
    return std::visit([](const auto& v) -> TagType {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, int8_t>) {
            return TagType::Byte;
        } else if constexpr (std::is_same_v<T, int16_t>) {
            return TagType::Short;
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return TagType::Int;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return TagType::Long;
        } else if constexpr (std::is_same_v<T, float>) {
            return TagType::Float;
        } else if constexpr (std::is_same_v<T, double>) {
            return TagType::Double;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return TagType::String;
        } else if constexpr (std::is_same_v<T, TagByteArray>) {
            return TagType::ByteArray;
        } else if constexpr (std::is_same_v<T, TagIntArray>) {
            return TagType::IntArray;
        } else if constexpr (std::is_same_v<T, TagList>) {
            return TagType::List;
        } else {
            static_assert(std::is_same_v<T, TagCompound>, "Unhandled TagNode alternative");
            return TagType::Compound;
        }
    }, value_);
}

}  // namespace tagmap
