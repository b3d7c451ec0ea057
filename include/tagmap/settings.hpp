#pragma once

/**
 * @file settings.hpp
 * @brief Codec options and reserved keys loaded from a settings file
 *
 * Recognised entries:
 *   max_depth: 256               nesting cap for encode/decode
 *   defaults: false              start from empty reserved sets
 *   reserved:tag: <name>         add a tag-tree reserved name
 *   reserved:map: <name>         add a config-map reserved name
 *
 * Anything else is reported and ignored.
 */

#include "tagmap/reserved_keys.hpp"
#include "tagmap/settings_parser.hpp"
#include "tagmap/tag_codec.hpp"

#include <optional>
#include <string>

namespace tagmap {

struct Settings {
    CodecOptions codec;
    ReservedKeys reserved = ReservedKeys::defaults();

    /// Build settings from a parsed document
    [[nodiscard]] static Settings fromDocument(const SettingsDocument& doc);

    /// Parse and build, nullopt if the file can't be read
    [[nodiscard]] static std::optional<Settings> loadFile(const std::string& path);
};

}  // namespace tagmap
