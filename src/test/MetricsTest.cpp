#include <cassert>
#include <cmath>
#include <iostream>

#include "application/GraphMetrics.hpp"
#include "application/TextMetrics.hpp"

using namespace crawlscope::application;

namespace {

bool Near(double a, double b, double tolerance = 1e-9) {
    return std::fabs(a - b) < tolerance;
}

double Sum(const std::map<std::string, double>& scores) {
    double total = 0.0;
    for (const auto& entry : scores) total += entry.second;
    return total;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Graph/Text Metrics Test..." << std::endl;

    // PageRank
    {
        assert(GraphMetrics::PageRank({}, {}).empty());

        auto cycle = GraphMetrics::PageRank({"a", "b"}, {{"a", "b"}, {"b", "a"}});
        assert(Near(cycle["a"], 0.5));
        assert(Near(cycle["b"], 0.5));

        auto isolated = GraphMetrics::PageRank({"a", "b", "c"}, {});
        assert(Near(isolated["a"], 1.0 / 3.0));
        assert(Near(Sum(isolated), 1.0));

        // Edges leaving the node set are ignored
        auto star = GraphMetrics::PageRank({"home", "x", "y"},
            {{"x", "home"}, {"y", "home"}, {"home", "x"}, {"home", "outside"}});
        assert(Near(Sum(star), 1.0));
        assert(star.count("outside") == 0);
        assert(star["home"] > star["x"]);
        assert(star["x"] > star["y"]);
    }
    std::cout << "[PASS] PageRank normalization and internal edges." << std::endl;

    // Hub pages
    {
        auto hubs = GraphMetrics::HubPages({{"a", "home"}, {"b", "home"}, {"a", "blog"}, {"c", "about"}, {"d", "blog"}});
        assert(hubs.size() == 3);
        assert(hubs[0].first == "home" && hubs[0].second == 2);
        assert(hubs[1].first == "blog" && hubs[1].second == 2);
        assert(hubs[2].first == "about" && hubs[2].second == 1);
        assert(GraphMetrics::HubPages({{"a", "b"}, {"a", "c"}}, 1).size() == 1);
    }
    std::cout << "[PASS] Hub pages ordered by inbound links." << std::endl;

    // Keyword counting
    {
        assert(TextMetrics::CountOccurrences("Privacy policy. PRIVACY matters; privacy!", "privacy", false) == 3);
        assert(TextMetrics::CountOccurrences("Privacy policy. PRIVACY matters; privacy!", "privacy", true) == 1);
        assert(TextMetrics::CountOccurrences("cart carts shopping-cart", "cart", false) == 2);
        assert(TextMetrics::CountOccurrences("c++ and c", "c++", false) == 0);
        assert(TextMetrics::CountOccurrences("price (usd) here", "usd", false) == 1);
        assert(TextMetrics::CountOccurrences("", "any", false) == 0);
        assert(TextMetrics::CountOccurrences("text", "", false) == 0);
    }
    std::cout << "[PASS] Whole-word keyword counting." << std::endl;

    // TF-IDF
    {
        std::map<std::string, std::map<std::string, int>> frequencies;
        frequencies["privacy"]["/a"] = 2;
        frequencies["privacy"]["/b"] = 1;
        frequencies["cookie"];

        auto scores = TextMetrics::TfIdf(frequencies, 4);
        assert(scores.count("cookie") == 0);
        assert(Near(scores["privacy"]["/a"], TextMetrics::Round(2.0 * std::log(2.0), 4)));
        assert(Near(scores["privacy"]["/b"], TextMetrics::Round(std::log(2.0), 4)));
        assert(scores["privacy"].count("/c") == 0);

        // A keyword on every page carries no weight
        std::map<std::string, std::map<std::string, int>> everywhere = {{"home", {{"/a", 3}, {"/b", 1}}}};
        auto flat = TextMetrics::TfIdf(everywhere, 2);
        assert(Near(flat["home"]["/a"], 0.0));

        assert(TextMetrics::TfIdf(frequencies, 0).empty());
    }
    std::cout << "[PASS] TF-IDF scores." << std::endl;

    assert(Near(TextMetrics::Round(66.666666, 2), 66.67));
    assert(Near(TextMetrics::Round(2.5, 0), 3.0));

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
