#include "tagmap/settings.hpp"

#include <iostream>

namespace tagmap {

Settings Settings::fromDocument(const SettingsDocument& doc) {
    Settings settings;
    if (!doc.getBool("defaults", true)) {
        settings.reserved = ReservedKeys{};
    }

    for (const auto& entry : doc) {
        if (entry.key == "defaults") {
            continue;
        }

        if (entry.key == "max_depth") {
            long depth = entry.value.asInt(-1);
            if (depth <= 0) {
                std::cerr << "[Settings] Line " << entry.line
                          << ": max_depth must be a positive integer, got '"
                          << entry.value.asString() << "'\n";
                continue;
            }
            settings.codec.maxDepth = static_cast<size_t>(depth);
        } else if (entry.key == "reserved") {
            std::string_view name = entry.value.asString();
            if (name.empty()) {
                std::cerr << "[Settings] Line " << entry.line << ": reserved key name missing\n";
            } else if (entry.suffix == "tag") {
                settings.reserved.addTagName(name);
            } else if (entry.suffix == "map") {
                settings.reserved.addMapName(name);
            } else {
                std::cerr << "[Settings] Line " << entry.line
                          << ": unknown reserved namespace '" << entry.suffix << "'\n";
            }
        } else {
            std::cerr << "[Settings] Line " << entry.line
                      << ": ignoring unknown setting '" << entry.key << "'\n";
        }
    }

    return settings;
}

std::optional<Settings> Settings::loadFile(const std::string& path) {
    SettingsParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        return std::nullopt;
    }
    return fromDocument(*doc);
}

}  // namespace tagmap
