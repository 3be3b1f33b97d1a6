#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_guard {

inline constexpr std::size_t kMaxDescriptionLength = 500;
inline constexpr std::string_view kFilteredMarker = "[FILTERED_CONTENT]";
inline constexpr std::string_view kTruncationMarker = "...";

// ---------------------------------------------------------------------------
// SanitizedText - sanitizer output plus what was filtered.
//
// filtered_patterns names the pattern classes that matched (e.g.
// "template_marker"), never the matched text itself.
// ---------------------------------------------------------------------------
struct SanitizedText {
    std::string text;
    std::vector<std::string> filtered_patterns;
    bool truncated = false;

    [[nodiscard]] bool Modified() const noexcept {
        return truncated || !filtered_patterns.empty();
    }
};

// Replace injection-prone substrings with [FILTERED_CONTENT], in order:
//   {{...}}, SYSTEM:, ignore ... previous, execute ... command, $(...),
//   <script...>
// then cap the result at kMaxDescriptionLength bytes (including the "..."
// marker appended on truncation). Never throws.
[[nodiscard]] SanitizedText SanitizeDescriptionDetailed(std::string_view description);

[[nodiscard]] std::string SanitizeDescription(std::string_view description);

} // namespace mcp_guard
