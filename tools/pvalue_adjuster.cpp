#include "clinmcp/tool.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

namespace clinmcp {
namespace tools {

namespace {

struct Adjustment {
    std::vector<double> adjusted;
    std::vector<bool> reject;
};

double round6(double v) {
    return std::round(v * 1e6) / 1e6;
}

std::vector<size_t> order_by(const std::vector<double>& p, bool descending) {
    std::vector<size_t> idx(p.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        return descending ? p[a] > p[b] : p[a] < p[b];
    });
    return idx;
}

Adjustment bonferroni(const std::vector<double>& p, double alpha) {
    const double n = static_cast<double>(p.size());
    Adjustment r;
    for (double v : p) {
        r.adjusted.push_back(std::min(1.0, v * n));
        r.reject.push_back(v <= alpha / n);
    }
    return r;
}

// Step-down: stop rejecting at the first non-significant ordered p-value.
Adjustment holm(const std::vector<double>& p, double alpha) {
    const size_t n = p.size();
    Adjustment r{std::vector<double>(n, 0.0), std::vector<bool>(n, false)};
    auto idx = order_by(p, false);
    bool still_rejecting = true;
    for (size_t i = 0; i < n; ++i) {
        double k = static_cast<double>(n - i);
        r.adjusted[idx[i]] = std::min(1.0, p[idx[i]] * k);
        still_rejecting = still_rejecting && p[idx[i]] <= alpha / k;
        r.reject[idx[i]] = still_rejecting;
    }
    return r;
}

// Step-up: the largest significant p-value rejects itself and every smaller one.
Adjustment hochberg(const std::vector<double>& p, double alpha) {
    const size_t n = p.size();
    Adjustment r{std::vector<double>(n, 0.0), std::vector<bool>(n, false)};
    auto idx = order_by(p, true);
    for (size_t i = 0; i < n; ++i) {
        r.adjusted[idx[i]] = std::min(1.0, p[idx[i]] * static_cast<double>(i + 1));
    }
    for (size_t i = 0; i < n; ++i) {
        if (p[idx[i]] <= alpha / static_cast<double>(i + 1)) {
            for (size_t j = i; j < n; ++j) r.reject[idx[j]] = true;
            break;
        }
    }
    return r;
}

Adjustment fdr_bh(const std::vector<double>& p, double alpha) {
    const size_t n = p.size();
    const double dn = static_cast<double>(n);
    Adjustment r{std::vector<double>(n, 0.0), std::vector<bool>(n, false)};
    auto idx = order_by(p, false);
    for (size_t i = n; i-- > 0;) {
        if (p[idx[i]] <= static_cast<double>(i + 1) / dn * alpha) {
            for (size_t j = 0; j <= i; ++j) r.reject[idx[j]] = true;
            break;
        }
    }
    for (size_t i = 0; i < n; ++i) {
        r.adjusted[idx[i]] = std::min(1.0, p[idx[i]] * dn / static_cast<double>(i + 1));
    }
    return r;
}

std::string interpretation(const std::string& method, size_t significant, size_t tests) {
    std::string ratio = std::to_string(significant) + "/" + std::to_string(tests);
    if (significant == 0) {
        return "No significant results after " + method + " adjustment for " +
               std::to_string(tests) + " tests.";
    }
    if (method == "bonferroni") {
        return "Using Bonferroni correction (most conservative), " + ratio + " tests remain significant.";
    }
    if (method == "holm") {
        return "Using Holm-Bonferroni (step-down), " + ratio + " tests remain significant.";
    }
    if (method == "hochberg") {
        return "Using Hochberg (step-up), " + ratio + " tests remain significant.";
    }
    return "Using Benjamini-Hochberg FDR control, " + ratio + " tests remain significant.";
}

nlohmann::json run(const nlohmann::json& input) {
    auto pvalues = input.value("pvalues", std::vector<double>{});
    std::string method = input.value("method", std::string("bonferroni"));
    double alpha = input.value("alpha", 0.05);

    if (pvalues.empty()) {
        return nlohmann::json{{"error", "No p-values provided"}};
    }

    std::vector<std::string> labels;
    if (input.contains("labels") && input.at("labels").is_array()) {
        labels = input.at("labels").get<std::vector<std::string>>();
    }
    for (size_t i = labels.size(); i < pvalues.size(); ++i) {
        labels.push_back("Test " + std::to_string(i + 1));
    }

    Adjustment adj;
    if (method == "bonferroni") {
        adj = bonferroni(pvalues, alpha);
    } else if (method == "holm") {
        adj = holm(pvalues, alpha);
    } else if (method == "hochberg") {
        adj = hochberg(pvalues, alpha);
    } else if (method == "fdr_bh") {
        adj = fdr_bh(pvalues, alpha);
    } else {
        return nlohmann::json{{"error", "Unknown method: " + method}};
    }

    nlohmann::json results = nlohmann::json::array();
    size_t significant = 0;
    for (size_t i = 0; i < pvalues.size(); ++i) {
        bool reject = adj.reject[i];
        if (reject) ++significant;
        results.push_back({
            {"test", labels[i]},
            {"original_pvalue", round6(pvalues[i])},
            {"adjusted_pvalue", round6(adj.adjusted[i])},
            {"significant", reject},
            {"conclusion", reject ? "Reject null" : "Fail to reject null"}
        });
    }

    nlohmann::json out = {
        {"method", method},
        {"alpha", alpha},
        {"n_tests", pvalues.size()},
        {"n_significant", significant},
        {"results", std::move(results)},
        {"summary", {
            {"min_pvalue", *std::min_element(pvalues.begin(), pvalues.end())},
            {"max_pvalue", *std::max_element(pvalues.begin(), pvalues.end())},
            {"min_adjusted", *std::min_element(adj.adjusted.begin(), adj.adjusted.end())},
            {"max_adjusted", std::min(1.0, *std::max_element(adj.adjusted.begin(), adj.adjusted.end()))}
        }},
        {"interpretation", interpretation(method, significant, pvalues.size())}
    };
    return out;
}

} // namespace

ToolModule pvalue_adjuster_module() {
    ToolModule m;
    m.stem = "pvalue_adjuster";
    m.docstring = R"(
        Adjust p-values for multiple comparisons.

        Example:
            Input: Raw p-values from several endpoints and the adjustment method
            Output: Adjusted p-values with reject / fail-to-reject conclusions

        Parameters:
            pvalues : List[float]
                Unadjusted p-values, one per test
            method : str, optional
                bonferroni, holm, hochberg or fdr_bh (default: 'bonferroni')
            alpha : float, optional
                Family-wise significance level (default: 0.05)
            labels : list, optional
                Test labels, in the order of pvalues
    )";
    m.load = [] { return ToolEntryPoint(run); };
    return m;
}

} // namespace tools
} // namespace clinmcp
