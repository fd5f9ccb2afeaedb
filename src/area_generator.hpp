#pragma once

#include "area_template.hpp"
#include "dungeon_map.hpp"
#include "gen_report.hpp"

#include <cstdint>
#include <string>

// Map size limits accepted by validateTemplate().
constexpr int kMinMapSide = 8;
constexpr int kMaxMapSide = 512;
constexpr int kMaxBspDepth = 16;

// Checks every template field the selected algorithm depends on. Consumes no
// randomness. Returns false with a description of the first bad field.
bool validateTemplate(const AreaTemplate& area, std::string* err = nullptr);

// Generates a complete, populated area.
//
// Deterministic: the same (seed, area) always yields the same map. On success
// `out` is replaced and true is returned (warnings, if any, are in
// report->warnings). On failure `out` is left untouched, report->failure says
// why and `err` carries a human readable message.
bool generateArea(uint32_t seed,
                  const AreaTemplate& area,
                  DungeonMap& out,
                  GenerationReport* report = nullptr,
                  std::string* err = nullptr);
