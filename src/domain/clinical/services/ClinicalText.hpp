/**
 * @file ClinicalText.hpp
 * @brief Keyword predicates over lower-cased clinical text.
 *
 * All clinical phrase detection in the guardrail core goes through these
 * helpers so that every heuristic is an explicit ordered list of needles
 * over a normalized corpus string.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace trialguard::domain::clinical::text {

/** @brief ASCII lower-case copy. */
std::string ToLower(const std::string& input);

/** @brief ASCII upper-case copy. */
std::string ToUpper(const std::string& input);

/** @brief Strips leading/trailing whitespace and collapses inner runs to one space. */
std::string CollapseWhitespace(const std::string& input);

/** @brief Joins items with a single space. */
std::string Join(const std::vector<std::string>& items);

/** @brief Joins items with a single space and lower-cases the result. */
std::string JoinLower(const std::vector<std::string>& items);

bool Contains(const std::string& haystack, const std::string& needle);

/** @brief True if any needle is a substring of haystack. Expects lower-cased input. */
bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles);

/** @brief True if any element of items, lower-cased, contains any needle. */
bool AnyItemContains(const std::vector<std::string>& items, const std::vector<std::string>& needles);

/**
 * @brief Like ContainsAny, but a match only counts when the needle starts a word
 * (the preceding character is not a letter or digit).
 */
bool ContainsAnyWord(const std::string& haystack, const std::vector<std::string>& needles);

/**
 * @brief Detects "<marker><spaces><qualifier>" starting at a word boundary,
 * e.g. "her2 positive", "her2  positive" or "her2positive".
 *
 * Nothing is required after the qualifier, so "her2 positiveness" matches too.
 */
bool ContainsQualifiedMarker(const std::string& haystack, const std::string& marker, const std::string& qualifier);

/**
 * @brief Extracts the digit following "ECOG" (case-insensitive, optional spaces).
 * @return nullopt when no "ECOG<digit>" notation is present.
 */
std::optional<int> ParseEcogScore(const std::string& performanceStatus);

} // namespace trialguard::domain::clinical::text
