/**
 * @file ClinicalText.cpp
 * @brief Implementation of clinical keyword predicates.
 */

#include "domain/clinical/services/ClinicalText.hpp"

#include <cctype>

namespace trialguard::domain::clinical::text {

namespace {

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool StartsWord(const std::string& haystack, size_t pos) {
    return pos == 0 || !IsWordChar(haystack[pos - 1]);
}

} // namespace

std::string ToLower(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string ToUpper(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

std::string CollapseWhitespace(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    bool pendingSpace = false;
    for (char c : input) {
        if (IsSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string Join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out.push_back(' ');
        out += items[i];
    }
    return out;
}

std::string JoinLower(const std::vector<std::string>& items) {
    return ToLower(Join(items));
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (Contains(haystack, needle)) return true;
    }
    return false;
}

bool AnyItemContains(const std::vector<std::string>& items, const std::vector<std::string>& needles) {
    for (const auto& item : items) {
        if (ContainsAny(ToLower(item), needles)) return true;
    }
    return false;
}

bool ContainsAnyWord(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (needle.empty()) continue;
        size_t pos = haystack.find(needle);
        while (pos != std::string::npos) {
            if (StartsWord(haystack, pos)) return true;
            pos = haystack.find(needle, pos + 1);
        }
    }
    return false;
}

bool ContainsQualifiedMarker(const std::string& haystack, const std::string& marker, const std::string& qualifier) {
    size_t pos = haystack.find(marker);
    while (pos != std::string::npos) {
        if (StartsWord(haystack, pos)) {
            size_t cursor = pos + marker.size();
            while (cursor < haystack.size() && IsSpace(haystack[cursor])) ++cursor;
            if (haystack.compare(cursor, qualifier.size(), qualifier) == 0) return true;
        }
        pos = haystack.find(marker, pos + 1);
    }
    return false;
}

std::optional<int> ParseEcogScore(const std::string& performanceStatus) {
    const std::string lowered = ToLower(performanceStatus);
    size_t pos = lowered.find("ecog");
    while (pos != std::string::npos) {
        size_t cursor = pos + 4;
        while (cursor < lowered.size() && IsSpace(lowered[cursor])) ++cursor;
        if (cursor < lowered.size() && std::isdigit(static_cast<unsigned char>(lowered[cursor]))) {
            return lowered[cursor] - '0';
        }
        pos = lowered.find("ecog", pos + 1);
    }
    return std::nullopt;
}

} // namespace trialguard::domain::clinical::text
