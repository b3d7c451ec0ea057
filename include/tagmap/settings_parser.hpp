#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagmap {

// ============================================================================
// SettingValue - A parsed setting value
// ============================================================================

/**
 * @brief The text after the colon(s), with typed accessors
 */
class SettingValue {
public:
    SettingValue() = default;
    explicit SettingValue(std::string_view text) : text_(text) {}

    // String access
    [[nodiscard]] std::string_view asString() const { return text_; }

    // Boolean access
    [[nodiscard]] bool asBool(bool defaultVal = false) const;

    // Numeric access
    [[nodiscard]] long asInt(long defaultVal = 0) const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// SettingEntry - A key-value pair with optional suffix
// ============================================================================

/**
 * @brief A settings entry
 *
 * Represents lines like:
 *   key: value
 *   key:suffix: value
 */
struct SettingEntry {
    std::string key;              // Primary key (e.g., "max_depth", "reserved")
    std::string suffix;           // Optional suffix (e.g., "tag", "map")
    SettingValue value;           // Value after the colon(s)
    int line = 0;                 // 1-based source line, for diagnostics

    [[nodiscard]] bool hasSuffix() const { return !suffix.empty(); }
};

// ============================================================================
// SettingsDocument - A parsed settings file
// ============================================================================

/**
 * @brief All entries of a settings file, in order
 *
 * Repeated keys are kept; simple lookups return the last one.
 */
class SettingsDocument {
public:
    SettingsDocument() = default;

    void addEntry(SettingEntry entry);

    // Lookup by key (returns last entry with this key, or nullptr)
    [[nodiscard]] const SettingEntry* get(std::string_view key) const;

    // Lookup by key and suffix
    [[nodiscard]] const SettingEntry* get(std::string_view key, std::string_view suffix) const;

    [[nodiscard]] long getInt(std::string_view key, long defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    // Get all entries with a given key
    [[nodiscard]] std::vector<const SettingEntry*> getAll(std::string_view key) const;

    [[nodiscard]] const std::vector<SettingEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<SettingEntry> entries_;
};

// ============================================================================
// SettingsParser - Parses settings files
// ============================================================================

/**
 * @brief Parser for line-based settings files
 *
 * Format:
 * ```
 * # Comments start with #
 * max_depth: 256
 * reserved:tag: PublicBukkitValues
 * reserved:map: custom-name
 * include: site.conf
 * ```
 *
 * Included files are parsed in place; their entries come before anything
 * that follows the include line, so later lines override them. An include
 * of a file that is still being parsed (directly or through other includes)
 * is logged as a cycle and skipped.
 */
class SettingsParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    SettingsParser() = default;

    /// Map a logical include path to a filesystem path.
    /// Without a resolver, includes are relative to the including file.
    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /**
     * @brief Parse a settings file
     * @param path Filesystem path to the file
     * @return Parsed document, or nullopt if the file can't be read
     */
    [[nodiscard]] std::optional<SettingsDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse settings from a string
     * @param content The settings text
     * @param basePath Base path for resolving includes (optional)
     */
    [[nodiscard]] SettingsDocument parseString(std::string_view content,
                                               const std::string& basePath = "") const;

private:
    // includeStack holds the normalized paths of the files being parsed
    bool parseFileInto(const std::string& path, SettingsDocument& doc,
                       std::vector<std::string>& includeStack) const;
    void parseContent(std::string_view content, const std::string& basePath,
                      SettingsDocument& doc, std::vector<std::string>& includeStack) const;
    void parseLine(std::string_view line, int lineNum, SettingsDocument& doc,
                   const std::string& basePath, std::vector<std::string>& includeStack) const;

    IncludeResolver includeResolver_;
};

}  // namespace tagmap
