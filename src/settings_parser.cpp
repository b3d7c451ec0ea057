#include "tagmap/settings_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace tagmap {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// SettingValue
// ============================================================================

bool SettingValue::asBool(bool defaultVal) const {
    if (text_.empty()) return defaultVal;

    if (text_ == "true" || text_ == "yes" || text_ == "1" || text_ == "on") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" || text_ == "off") {
        return false;
    }
    return defaultVal;
}

long SettingValue::asInt(long defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    long val = std::strtol(text_.c_str(), &end, 10);
    if (end == text_.c_str() || *end != '\0') return defaultVal;
    return val;
}

// ============================================================================
// SettingsDocument
// ============================================================================

void SettingsDocument::addEntry(SettingEntry entry) {
    entries_.push_back(std::move(entry));
}

const SettingEntry* SettingsDocument::get(std::string_view key) const {
    // Return last entry with this key (later overrides earlier)
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

const SettingEntry* SettingsDocument::get(std::string_view key, std::string_view suffix) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key && it->suffix == suffix) {
            return &(*it);
        }
    }
    return nullptr;
}

long SettingsDocument::getInt(std::string_view key, long defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

bool SettingsDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

std::vector<const SettingEntry*> SettingsDocument::getAll(std::string_view key) const {
    std::vector<const SettingEntry*> result;
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            result.push_back(&entry);
        }
    }
    return result;
}

// ============================================================================
// SettingsParser
// ============================================================================

namespace {

// Comparable form of a path for cycle detection
std::string normalizedPath(const std::string& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return std::filesystem::path(path).lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

}  // namespace

std::optional<SettingsDocument> SettingsParser::parseFile(const std::string& path) const {
    std::vector<std::string> includeStack;
    SettingsDocument doc;
    if (!parseFileInto(path, doc, includeStack)) {
        return std::nullopt;
    }
    return doc;
}

bool SettingsParser::parseFileInto(const std::string& path, SettingsDocument& doc,
                                   std::vector<std::string>& includeStack) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Extract base path for relative includes
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    includeStack.push_back(normalizedPath(path));
    parseContent(buffer.str(), basePath, doc, includeStack);
    includeStack.pop_back();
    return true;
}

SettingsDocument SettingsParser::parseString(std::string_view content, const std::string& basePath) const {
    SettingsDocument doc;
    std::vector<std::string> includeStack;
    parseContent(content, basePath, doc, includeStack);
    return doc;
}

void SettingsParser::parseContent(std::string_view content, const std::string& basePath,
                                  SettingsDocument& doc,
                                  std::vector<std::string>& includeStack) const {
    std::string_view remaining = content;
    int lineNum = 0;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        ++lineNum;

        // Remove trailing \r if present (Windows line endings)
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        parseLine(line, lineNum, doc, basePath, includeStack);
    }
}

void SettingsParser::parseLine(std::string_view line, int lineNum, SettingsDocument& doc,
                               const std::string& basePath,
                               std::vector<std::string>& includeStack) const {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
        return;
    }

    SettingEntry entry;
    entry.line = lineNum;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // No colon - treat as simple key with no value
        entry.key = std::string(line);
        doc.addEntry(std::move(entry));
        return;
    }

    entry.key = std::string(trim(line.substr(0, colonPos)));

    // Check for second colon (key:suffix:)
    auto rest = line.substr(colonPos + 1);
    auto secondColon = rest.find(':');
    if (secondColon != std::string_view::npos) {
        entry.suffix = std::string(trim(rest.substr(0, secondColon)));
        rest = rest.substr(secondColon + 1);
    }
    rest = trim(rest);

    if (entry.key == "include") {
        std::string includePath(rest);
        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath)
                                                    : basePath + includePath;

        // A file already being parsed further up would recurse forever
        std::string normalized = normalizedPath(resolvedPath);
        if (std::find(includeStack.begin(), includeStack.end(), normalized) != includeStack.end()) {
            std::cerr << "[SettingsParser] Line " << lineNum
                      << ": include cycle '" << includePath << "'\n";
            return;
        }

        if (!parseFileInto(resolvedPath, doc, includeStack)) {
            std::cerr << "[SettingsParser] Line " << lineNum
                      << ": cannot read include '" << includePath << "'\n";
        }
        return;
    }

    if (!rest.empty()) {
        entry.value = SettingValue(rest);
    }
    doc.addEntry(std::move(entry));
}

}  // namespace tagmap
