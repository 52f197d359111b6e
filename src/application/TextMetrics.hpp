/**
 * @file TextMetrics.hpp
 * @brief Keyword counting and TF-IDF weighting.
 */

#pragma once

#include <string>
#include <map>

namespace crawlscope::application {

class TextMetrics {
public:
    /**
     * @brief Whole-word occurrences of @p keyword in @p text.
     *
     * Matches must sit on word boundaries, so "cat" does not match "concat".
     * Case-insensitive matching lowercases both sides.
     */
    static int CountOccurrences(const std::string& text, const std::string& keyword, bool caseSensitive);

    /**
     * @brief tf * ln(N / df) per keyword and document, rounded to 4 decimals.
     * @param frequencies keyword -> document -> raw count; zero counts absent.
     * @param documentCount N, the number of sampled documents.
     *
     * A keyword found in no document gets no entry at all.
     */
    static std::map<std::string, std::map<std::string, double>> TfIdf(
        const std::map<std::string, std::map<std::string, int>>& frequencies,
        int documentCount);

    /** @brief Rounds half away from zero to @p decimals places. */
    static double Round(double value, int decimals);
};

} // namespace crawlscope::application
