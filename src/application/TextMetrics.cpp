#include "application/TextMetrics.hpp"
#include <regex>
#include <cmath>
#include <algorithm>
#include <cctype>

namespace crawlscope::application {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string EscapeRegex(const std::string& literal) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (kSpecial.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

} // namespace

int TextMetrics::CountOccurrences(const std::string& text, const std::string& keyword, bool caseSensitive) {
    if (keyword.empty() || text.empty()) {
        return 0;
    }
    const std::string haystack = caseSensitive ? text : ToLower(text);
    const std::string needle = caseSensitive ? keyword : ToLower(keyword);

    std::regex pattern("\\b" + EscapeRegex(needle) + "\\b");
    auto begin = std::sregex_iterator(haystack.begin(), haystack.end(), pattern);
    return static_cast<int>(std::distance(begin, std::sregex_iterator()));
}

std::map<std::string, std::map<std::string, double>> TextMetrics::TfIdf(
    const std::map<std::string, std::map<std::string, int>>& frequencies,
    int documentCount) {
    std::map<std::string, std::map<std::string, double>> scores;
    if (documentCount <= 0) {
        return scores;
    }

    for (const auto& [keyword, perDocument] : frequencies) {
        int documentFrequency = 0;
        for (const auto& entry : perDocument) {
            if (entry.second > 0) ++documentFrequency;
        }
        if (documentFrequency == 0) {
            continue;
        }

        const double idf = std::log(static_cast<double>(documentCount) / static_cast<double>(documentFrequency));
        auto& keywordScores = scores[keyword];
        for (const auto& [document, count] : perDocument) {
            if (count > 0) {
                keywordScores[document] = Round(static_cast<double>(count) * idf, 4);
            }
        }
    }
    return scores;
}

double TextMetrics::Round(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

} // namespace crawlscope::application
