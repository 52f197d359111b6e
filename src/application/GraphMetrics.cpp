#include "application/GraphMetrics.hpp"
#include <unordered_map>
#include <algorithm>

namespace crawlscope::application {

std::map<std::string, double> GraphMetrics::PageRank(const std::vector<std::string>& nodes,
                                                     const std::vector<std::pair<std::string, std::string>>& edges,
                                                     double damping,
                                                     int iterations) {
    std::map<std::string, double> result;
    if (nodes.empty()) {
        return result;
    }

    // Dense indices for the node set
    std::unordered_map<std::string, size_t> indexOf;
    std::vector<std::string> order;
    for (const auto& node : nodes) {
        if (indexOf.emplace(node, order.size()).second) {
            order.push_back(node);
        }
    }
    const size_t n = order.size();

    std::vector<std::pair<size_t, size_t>> internalEdges;
    std::vector<int> outDegree(n, 0);
    for (const auto& [source, target] : edges) {
        auto s = indexOf.find(source);
        auto t = indexOf.find(target);
        if (s == indexOf.end() || t == indexOf.end()) {
            continue;
        }
        internalEdges.emplace_back(s->second, t->second);
        ++outDegree[s->second];
    }

    std::vector<double> scores(n, 1.0 / static_cast<double>(n));
    std::vector<double> next(n);
    const double base = (1.0 - damping) / static_cast<double>(n);

    for (int iteration = 0; iteration < iterations; ++iteration) {
        std::fill(next.begin(), next.end(), base);
        for (const auto& [s, t] : internalEdges) {
            next[t] += damping * scores[s] / static_cast<double>(outDegree[s]);
        }
        scores.swap(next);
    }

    double total = 0.0;
    for (double score : scores) {
        total += score;
    }
    for (size_t i = 0; i < n; ++i) {
        result[order[i]] = total > 0.0 ? scores[i] / total : scores[i];
    }
    return result;
}

std::vector<std::pair<std::string, int>> GraphMetrics::HubPages(const std::vector<std::pair<std::string, std::string>>& edges,
                                                                size_t topN) {
    std::vector<std::pair<std::string, int>> counts;
    std::unordered_map<std::string, size_t> position;
    for (const auto& edge : edges) {
        const std::string& target = edge.second;
        auto it = position.find(target);
        if (it == position.end()) {
            position.emplace(target, counts.size());
            counts.emplace_back(target, 1);
        } else {
            ++counts[it->second].second;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (counts.size() > topN) {
        counts.resize(topN);
    }
    return counts;
}

} // namespace crawlscope::application
