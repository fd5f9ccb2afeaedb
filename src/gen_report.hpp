#pragma once

#include <cstdint>
#include <string>
#include <vector>

// If a generation call fails, the failure is categorized for tooling and
// callers that want to react differently (e.g. retry with another seed on
// DisconnectedMap, but surface InvalidParameter to the author).
//
// Append new categories at the end; the names are part of the CLI output.
enum class GenFailure : uint8_t {
    None = 0,
    InvalidParameter,
    GenerationTimeout,
    DisconnectedMap,
};

inline const char* genFailureName(GenFailure k) {
    switch (k) {
        case GenFailure::None:              return "None";
        case GenFailure::InvalidParameter:  return "InvalidParameter";
        case GenFailure::GenerationTimeout: return "GenerationTimeout";
        case GenFailure::DisconnectedMap:   return "DisconnectedMap";
    }
    return "None";
}

// Soft signals: the call still succeeded and the map is valid.
enum class GenWarningKind : uint8_t {
    PartialGeneration = 0,
};

inline const char* genWarningKindName(GenWarningKind k) {
    switch (k) {
        case GenWarningKind::PartialGeneration: return "PartialGeneration";
    }
    return "PartialGeneration";
}

struct GenWarning {
    GenWarningKind kind = GenWarningKind::PartialGeneration;
    std::string message;
};

struct GenerationReport {
    // Only meaningful when the call returned false.
    GenFailure failure = GenFailure::None;

    std::vector<GenWarning> warnings;

    // Layout bookkeeping, filled best-effort.
    int attempts = 0;        // cavern attempts (1 + retries used)
    int roomsRequested = 0;  // simple random target
    int bspLeaves = 0;

    bool hasWarning(GenWarningKind k) const {
        for (const auto& w : warnings) {
            if (w.kind == k) return true;
        }
        return false;
    }
};
