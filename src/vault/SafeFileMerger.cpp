#include "vault/SafeFileMerger.hpp"

#include "vault/Markers.hpp"

#include <string>

namespace vault {

std::string neutralize_marker(const std::string& text) {
    const std::string marker = NOTES_MARKER;
    const std::string escaped = NOTES_MARKER_ESCAPED;

    std::string out;
    size_t pos = 0;
    while (true) {
        const size_t hit = text.find(marker, pos);
        if (hit == std::string::npos) break;
        out.append(text, pos, hit - pos);
        out += escaped;
        pos = hit + marker.size();
    }
    out.append(text, pos, std::string::npos);
    return out;
}

MergeResult merge_notes_detailed(const std::optional<std::string>& existing, const std::string& machine) {
    const std::string marker = NOTES_MARKER;

    MergeResult r;
    r.content = neutralize_marker(machine);
    if (!r.content.empty() && r.content.back() != '\n') r.content += "\n";

    if (!existing) {
        r.outcome = MergeOutcome::Created;
        r.content += marker + "\n";
        return r;
    }

    const size_t at = existing->find(marker);
    if (at == std::string::npos) {
        // file predates the tool or the marker was deleted: keep every byte of it
        r.outcome = MergeOutcome::RecoveredMissingMarker;
        r.content += marker + "\n";
        r.content += *existing;
        return r;
    }

    r.outcome = MergeOutcome::Preserved;
    r.content.append(*existing, at, std::string::npos);
    return r;
}

std::string merge_notes(const std::optional<std::string>& existing, const std::string& machine) {
    return merge_notes_detailed(existing, machine).content;
}

std::string overwrite(const std::string& machine) {
    return machine;
}

const char* merge_outcome_str(MergeOutcome outcome) {
    switch (outcome) {
        case MergeOutcome::Created:                return "created";
        case MergeOutcome::Preserved:              return "preserved";
        case MergeOutcome::RecoveredMissingMarker: return "recovered_missing_marker";
        default:                                   return "unknown";
    }
}

}  // namespace vault
