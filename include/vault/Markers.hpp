#pragma once

// Format constants shared by every file this tool writes. Changing any of
// them breaks preservation of notes in vaults written by earlier versions.

namespace vault {

// Everything from this marker to the end of an issue file belongs to the user.
inline constexpr const char* NOTES_MARKER = "%% USER_NOTES_START %%";

// Escaped spelling written when the marker text shows up in generated content.
inline constexpr const char* NOTES_MARKER_ESCAPED = "%\\% USER_NOTES_START %\\%";

inline constexpr const char* FRONTMATTER_DELIMITER = "---";

}  // namespace vault
