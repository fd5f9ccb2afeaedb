#pragma once

#include "area_template.hpp"

#include <string>

// Area template files (INI-ish: key = value, # or ; comments).
//
// `theme = <id>` resets the template to that theme's catalog defaults before
// any other key in the file is applied, wherever it appears. Keys missing from
// the file keep the value `out` had on entry.
//
// Returns false only if the file could not be read. Unknown keys and bad
// values are skipped and reported in outWarnings as "Line N: ...".
bool loadTemplateIni(const std::string& path, AreaTemplate& out, std::string* outWarnings = nullptr);

// Writes a commented template file with the catalog defaults for the dungeon
// theme. Returns true on success.
bool writeDefaultTemplateIni(const std::string& path);
