#pragma once
// Scrub: make untrusted error text safe to log, store and surface
//
// Provider and tool errors can echo request headers or keys back at us.
// sanitize_error() redacts secret-looking tokens and caps the length so
// escalation messages and guard reasons never carry payload content.

#include "types.hpp"
#include <string>
#include <vector>

namespace dharma {

constexpr size_t MAX_ERROR_CHARS = 200;

// Replace invalid UTF-8 sequences with U+FFFD
inline std::string sanitize_utf8(const std::string& input) {
    std::string output;
    output.reserve(input.size());

    auto replacement = [&output]() {
        output += '\xEF'; output += '\xBF'; output += '\xBD';
    };
    auto continuation = [&input](size_t i) {
        return i < input.size() && (static_cast<unsigned char>(input[i]) & 0xC0) == 0x80;
    };

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t width = 0;
        if (c < 0x80) width = 1;
        else if ((c & 0xE0) == 0xC0) width = 2;
        else if ((c & 0xF0) == 0xE0) width = 3;
        else if ((c & 0xF8) == 0xF0) width = 4;

        bool valid = width > 0;
        for (size_t k = 1; valid && k < width; ++k) {
            valid = continuation(i + k);
        }
        if (valid) {
            output.append(input, i, width);
            i += width;
        } else {
            replacement();
            ++i;
        }
    }
    return output;
}

namespace detail {

inline bool is_secret_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == ':' || c == '+' || c == '/' || c == '=';
}

// Redact marker + following token; bare markers without a token are kept
inline void scrub_after_marker(std::string& text, const std::string& marker) {
    static const std::string redacted = "[REDACTED]";
    size_t search_from = 0;
    while (true) {
        size_t start = text.find(marker, search_from);
        if (start == std::string::npos) break;
        size_t content_start = start + marker.size();
        size_t end = content_start;
        while (end < text.size() && is_secret_char(text[end])) ++end;
        if (end == content_start) {
            search_from = content_start;
            continue;
        }
        text.replace(start, end - start, redacted);
        search_from = start + redacted.size();
    }
}

} // namespace detail

inline const std::vector<std::string>& secret_markers() {
    static const std::vector<std::string> markers = {
        // Provider key prefixes
        "sk-", "xoxb-", "xoxp-", "xoxs-", "xoxa-", "xapp-", "ghp_", "github_pat_",
        "hf_", "glpat-", "ya29.", "AIza", "AKIA", "ASIA",
        // Header, query and JSON markers
        "Authorization: Bearer ", "authorization: bearer ",
        "\"authorization\":\"Bearer ", "\"authorization\":\"bearer ",
        "api_key=", "access_token=", "refresh_token=", "id_token=",
        "\"api_key\":\"", "\"access_token\":\"", "\"refresh_token\":\"",
        "\"id_token\":\"", "\"token\":\"",
    };
    return markers;
}

inline std::string scrub_secret_patterns(const std::string& input) {
    std::string scrubbed = input;
    for (const auto& marker : secret_markers()) {
        detail::scrub_after_marker(scrubbed, marker);
    }
    return scrubbed;
}

// Scrub secrets, then cap at MAX_ERROR_CHARS code points with "..."
inline std::string sanitize_error(const std::string& input) {
    std::string scrubbed = scrub_secret_patterns(sanitize_utf8(input));
    if (char_count(scrubbed) <= MAX_ERROR_CHARS) {
        return scrubbed;
    }
    return scrubbed.substr(0, char_boundary(scrubbed, MAX_ERROR_CHARS)) + "...";
}

} // namespace dharma
