#include "clinmcp/tool.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace clinmcp {
namespace tools {

namespace {

constexpr double kMaxSampleSize = 1e9;

// Inverse of the standard normal CDF (Acklam's rational approximation,
// relative error below 1.2e-9).
double normal_quantile(double p) {
    if (p <= 0.0 || p >= 1.0) {
        throw std::invalid_argument("probability must be in (0, 1)");
    }
    static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                               -2.759285104469687e+02, 1.383577518672690e+02,
                               -3.066479806614716e+01, 2.506628277459239e+00};
    static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                               -1.556989798598866e+02, 6.680131188771972e+01,
                               -1.328068155288572e+01};
    static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                               -2.400758277161838e+00, -2.549732539343734e+00,
                               4.374664141464968e+00, 2.938163982698783e+00};
    static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01,
                               2.445134137142996e+00, 3.754408661907416e+00};
    const double low = 0.02425;

    if (p < low) {
        double q = std::sqrt(-2.0 * std::log(p));
        return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
               ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }
    if (p > 1.0 - low) {
        double q = std::sqrt(-2.0 * std::log(1.0 - p));
        return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
               ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }
    double q = p - 0.5;
    double r = q * q;
    return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
           (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
}

struct Design {
    std::string type;
    double alpha;
    double power;
    double ratio;

    // Two-sided for superiority, one-sided otherwise.
    double z_alpha() const {
        return type == "superiority" ? normal_quantile(1.0 - alpha / 2.0)
                                     : normal_quantile(1.0 - alpha);
    }
    double z_beta() const { return normal_quantile(power); }
};

double continuous_total(const nlohmann::json& input, const Design& d) {
    if (!input.contains("mean_difference") || !input.contains("std_dev")) {
        throw std::invalid_argument("mean_difference and std_dev required for continuous outcomes");
    }
    double diff = input.at("mean_difference").get<double>();
    double sd = input.at("std_dev").get<double>();
    double effect = d.type == "non_inferiority"
        ? (diff - input.value("margin", 0.0)) / sd
        : std::abs(diff) / sd;
    double z = d.z_alpha() + d.z_beta();
    return 2.0 * z * z * (1.0 + 1.0 / d.ratio) / (effect * effect);
}

double binary_total(const nlohmann::json& input, const Design& d) {
    if (!input.contains("control_rate") || !input.contains("treatment_rate")) {
        throw std::invalid_argument("control_rate and treatment_rate required for binary outcomes");
    }
    double p1 = input.at("control_rate").get<double>();
    double p2 = input.at("treatment_rate").get<double>();
    double p_avg = (p1 + d.ratio * p2) / (1.0 + d.ratio);

    double term = d.z_alpha() * std::sqrt(p_avg * (1.0 - p_avg) * (1.0 + 1.0 / d.ratio)) +
                  d.z_beta() * std::sqrt(p1 * (1.0 - p1) + p2 * (1.0 - p2) / d.ratio);
    double diff = p1 - p2;
    if (d.type == "non_inferiority") diff -= input.value("margin", 0.0);
    return term * term / (diff * diff) * (1.0 + d.ratio);
}

nlohmann::json recommendations(long total, double dropout, double power) {
    nlohmann::json out = nlohmann::json::array();
    if (total > 1000) {
        out.push_back("Large sample size required. Consider feasibility and recruitment strategies.");
    } else if (total > 500) {
        out.push_back("Moderate sample size. Multi-site recruitment may be beneficial.");
    }
    if (dropout > 0.2) {
        out.push_back("High dropout rate (" + std::to_string(std::lround(dropout * 100)) +
                      "%). Consider retention strategies.");
    }
    if (power < 0.8) {
        out.push_back("Statistical power (" + std::to_string(std::lround(power * 100)) +
                      "%) is below standard 80%. Consider increasing.");
    }
    return out;
}

nlohmann::json run(const nlohmann::json& input) {
    Design d{input.value("design_type", std::string("superiority")),
             input.value("alpha", 0.05),
             input.value("power", 0.8),
             input.value("allocation_ratio", 1.0)};
    std::string outcome = input.value("outcome_type", std::string("continuous"));
    double dropout = input.value("dropout_rate", 0.1);

    if (d.ratio <= 0.0 || dropout < 0.0 || dropout >= 1.0) {
        return nlohmann::json{{"error", "allocation_ratio must be positive and dropout_rate in [0, 1)"}};
    }

    double n = 0.0;
    try {
        if (outcome == "continuous") {
            n = continuous_total(input, d);
        } else if (outcome == "binary") {
            n = binary_total(input, d);
        } else {
            return nlohmann::json{
                {"error", "Unsupported outcome type: " + outcome},
                {"supported_types", {"continuous", "binary"}}
            };
        }
    } catch (const std::invalid_argument& e) {
        return nlohmann::json{{"error", std::string("Sample size calculation failed: ") + e.what()}};
    }
    if (!std::isfinite(n)) {
        return nlohmann::json{{"error", "Sample size calculation failed: effect size must be non-zero"}};
    }

    double adjusted = std::ceil(n / (1.0 - dropout));
    double control = std::ceil(adjusted / (1.0 + d.ratio));
    double treatment = std::ceil(control * d.ratio);
    // Bounds every integer below, so the conversions cannot overflow.
    if (adjusted > kMaxSampleSize || control + treatment > kMaxSampleSize) {
        return nlohmann::json{
            {"error", "Sample size calculation failed: required sample size exceeds 1e9 subjects"}};
    }
    long n_control = static_cast<long>(control);
    long n_treatment = static_cast<long>(treatment);
    long total = n_control + n_treatment;

    return nlohmann::json{
        {"sample_size_per_arm", {{"control", n_control}, {"treatment", n_treatment}}},
        {"total_sample_size", total},
        {"unadjusted_size", static_cast<long>(std::ceil(n))},
        {"adjusted_for_dropout", total},
        {"calculation_details", {
            {"design_type", d.type},
            {"outcome_type", outcome},
            {"alpha", d.alpha},
            {"power", d.power},
            {"allocation_ratio", d.ratio},
            {"dropout_rate", dropout}
        }},
        {"recommendations", recommendations(total, dropout, d.power)}
    };
}

} // namespace

ToolModule sample_size_calculator_module() {
    ToolModule m;
    m.stem = "sample_size_calculator";
    m.docstring = R"(
        Calculate sample size for clinical trials with continuous or binary endpoints.

        Example:
            Input: Study design parameters with effect size, power, and allocation ratio
            Output: Calculated sample size per arm, adjusted for dropout

        Parameters:
            design_type : str, optional
                Study design: 'superiority' or 'non_inferiority' (default: 'superiority')
            outcome_type : str, optional
                Primary endpoint type: 'continuous' or 'binary' (default: 'continuous')
            alpha : float, optional
                Type I error rate (default: 0.05)
            power : float, optional
                Statistical power (default: 0.8)
            allocation_ratio : float, optional
                Ratio of treatment to control group (default: 1.0)
            dropout_rate : float, optional
                Expected dropout rate (default: 0.1)
            mean_difference : float, optional
                Expected mean difference, continuous outcomes
            std_dev : float, optional
                Standard deviation, continuous outcomes
            control_rate : float, optional
                Event rate in the control group, binary outcomes
            treatment_rate : float, optional
                Event rate in the treatment group, binary outcomes
            margin : float, optional
                Non-inferiority margin (default: 0)

        Returns:
            sample_size_per_arm, total_sample_size, calculation_details
    )";
    m.load = [] { return ToolEntryPoint(run); };
    return m;
}

} // namespace tools
} // namespace clinmcp
