#pragma once

#include <string>

#include "dungeon.hpp"

// Generator config file (INI-ish: key = value, '#' or ';' comments).
//
// Every key is optional; missing keys keep their defaults and invalid values
// are ignored per key. Numeric values are clamped to sane ranges here, and
// sanitizeConfig() fixes up min/max pairs at generation time.

// Loads a config from disk. If the file is missing or unreadable, defaults are used.
GenConfig loadGenConfig(const std::string& path);

// Applies a single key/value pair (same keys as the file, case-insensitive).
// Returns false for unknown keys or unparsable values; `cfg` is unchanged then.
bool applyConfigKey(GenConfig& cfg, const std::string& key, const std::string& value);

// Writes a commented default config file. Returns true on success.
bool writeDefaultConfig(const std::string& path);

const char* layoutKindName(LayoutKind k);
bool parseLayoutKind(const std::string& s, LayoutKind& out);

// "#rrggbb" or "rrggbb" (alpha is always 255).
bool parseColorHex(const std::string& s, Color& out);
