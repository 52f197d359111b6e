/**
 * @file GraphMetrics.hpp
 * @brief Ranking computations over a sampled link graph.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <utility>

namespace crawlscope::application {

class GraphMetrics {
public:
    static constexpr double kDamping = 0.85;
    static constexpr int kIterations = 20;
    static constexpr size_t kHubCount = 20;

    /**
     * @brief Damped PageRank over @p nodes, run for a fixed iteration count.
     *
     * Only edges with both endpoints in @p nodes take part, both in the
     * outbound degree and in propagation. Scores are normalized to sum to 1.
     * Returns an empty map for an empty node set.
     */
    static std::map<std::string, double> PageRank(const std::vector<std::string>& nodes,
                                                  const std::vector<std::pair<std::string, std::string>>& edges,
                                                  double damping = kDamping,
                                                  int iterations = kIterations);

    /**
     * @brief Targets with the most inbound edges, descending.
     *
     * Counts every edge, not only those inside the node set. Ties keep the
     * order in which targets were first seen.
     */
    static std::vector<std::pair<std::string, int>> HubPages(const std::vector<std::pair<std::string, std::string>>& edges,
                                                             size_t topN = kHubCount);
};

} // namespace crawlscope::application
