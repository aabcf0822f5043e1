#pragma once

#include <optional>
#include <string>

namespace vault {

enum class MergeOutcome {
    Created,                  // no prior file
    Preserved,                // prior file had the marker; notes carried over
    RecoveredMissingMarker,   // prior file had no marker; all of it kept below a new one
};

struct MergeResult {
    std::string content;
    MergeOutcome outcome = MergeOutcome::Created;
};

// Machine-owned content first, then the user's section starting at the first
// NOTES_MARKER of the existing file, copied byte-for-byte. Purely textual:
// the user's section is never parsed.
MergeResult merge_notes_detailed(const std::optional<std::string>& existing, const std::string& machine);
std::string merge_notes(const std::optional<std::string>& existing, const std::string& machine);

// Fully machine-owned files (the board): nothing to keep.
std::string overwrite(const std::string& machine);

// Rewrites any marker text inside generated content so the split point can
// only ever be the marker line this merger appends.
std::string neutralize_marker(const std::string& text);

const char* merge_outcome_str(MergeOutcome outcome);

}  // namespace vault
