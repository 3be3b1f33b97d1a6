#include <mcp_guard/security/description_sanitizer.hpp>

#include <regex>

namespace mcp_guard {

namespace {

struct FilterPattern {
    const char* name;
    std::regex regex;
};

const std::vector<FilterPattern>& FilterPatterns() {
    static const std::vector<FilterPattern> patterns = [] {
        const auto icase = std::regex::ECMAScript | std::regex::icase;
        std::vector<FilterPattern> p;
        p.push_back({"template_marker", std::regex(R"(\{\{.*?\}\})")});
        p.push_back({"system_prefix", std::regex(R"(SYSTEM\s*:)", icase)});
        p.push_back({"ignore_previous", std::regex(R"(ignore\s+.*?previous)", icase)});
        p.push_back({"execute_command", std::regex(R"(execute\s+.*?command)", icase)});
        p.push_back({"shell_substitution", std::regex(R"(\$\(.*?\))")});
        p.push_back({"script_tag", std::regex(R"(<script.*?>)", icase)});
        return p;
    }();
    return patterns;
}

// Back up to the start of a UTF-8 sequence so truncation never splits a
// multi-byte character.
std::size_t Utf8Boundary(const std::string& s, std::size_t pos) {
    while (pos > 0 &&
           (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

} // anonymous namespace

SanitizedText SanitizeDescriptionDetailed(std::string_view description) {
    SanitizedText out;
    out.text.assign(description.data(), description.size());

    const std::string marker(kFilteredMarker);
    for (const auto& pattern : FilterPatterns()) {
        try {
            if (!std::regex_search(out.text, pattern.regex)) {
                continue;
            }
            out.text = std::regex_replace(out.text, pattern.regex, marker);
            out.filtered_patterns.emplace_back(pattern.name);
        } catch (const std::regex_error&) {
            // Pathological input exhausted the regex engine: fail closed.
            out.text = marker;
            out.filtered_patterns.emplace_back(pattern.name);
            return out;
        }
    }

    if (out.text.size() > kMaxDescriptionLength) {
        const auto keep = Utf8Boundary(
            out.text, kMaxDescriptionLength - kTruncationMarker.size());
        out.text.resize(keep);
        out.text.append(kTruncationMarker);
        out.truncated = true;
    }
    return out;
}

std::string SanitizeDescription(std::string_view description) {
    return SanitizeDescriptionDetailed(description).text;
}

} // namespace mcp_guard
