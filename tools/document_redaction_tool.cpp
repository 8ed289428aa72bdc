#include "clinmcp/tool.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace clinmcp {
namespace tools {

namespace {

struct Pattern {
    std::string category;
    std::string description;
    std::string risk;
    std::regex re;
};

struct Redaction {
    std::string original;
    std::string replacement;
    const Pattern* pattern;
    size_t start;
    size_t end;
};

Pattern make(const std::string& category, const std::string& description,
             const std::string& risk, const std::string& expr, bool ignore_case = true) {
    auto flags = std::regex::ECMAScript;
    if (ignore_case) flags |= std::regex::icase;
    return Pattern{category, description, risk, std::regex(expr, flags)};
}

const std::map<std::string, std::vector<Pattern>>& base_patterns() {
    static const std::map<std::string, std::vector<Pattern>> patterns = [] {
        std::map<std::string, std::vector<Pattern>> p;
        // Name heuristics rely on capitalisation, so they stay case sensitive.
        p["names"] = {
            make("names", "Titled names", "high", R"(\b(?:Mr|Mrs|Ms|Dr|Prof)\.?\s+[A-Z][a-z]+)", false),
            make("names", "Person names", "high", R"(\b[A-Z][a-z]+\s+[A-Z][a-z]+\b)", false),
        };
        p["contact"] = {
            make("phone", "Phone numbers", "medium", R"(\b\d{3}-\d{3}-\d{4}\b)"),
            make("email", "Email addresses", "high", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"),
        };
        p["medical_ids"] = {
            make("mrn", "Medical record numbers", "high", R"(\b(?:MRN|Medical Record|Patient ID)[:\s#]*\s*[A-Z0-9-]+)"),
            make("ssn", "Social Security Numbers", "high", R"(\b\d{3}-\d{2}-\d{4}\b)"),
            make("subject_id", "Subject identifiers", "high", R"(\b(?:Subject|Participant)[:\s#]*\s*[A-Z]*-?\d[A-Z0-9-]*)"),
        };
        p["dates"] = {
            make("date", "Dates (MM/DD/YYYY)", "medium", R"(\b\d{1,2}/\d{1,2}/\d{4}\b)"),
            make("date", "Dates (YYYY-MM-DD)", "medium", R"(\b\d{4}-\d{2}-\d{2}\b)"),
        };
        p["location"] = {
            make("zip", "ZIP codes", "low", R"(\b\d{5}(?:-\d{4})?\b)"),
        };
        p["financial"] = {
            make("credit_card", "Credit card numbers", "high", R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)"),
        };
        return p;
    }();
    return patterns;
}

std::vector<std::string> level_categories(const std::string& level) {
    if (level == "minimal") return {"medical_ids", "contact"};
    if (level == "standard") return {"medical_ids", "contact", "names", "dates"};
    std::vector<std::string> all;
    for (const auto& kv : base_patterns()) all.push_back(kv.first);
    return all;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool allowed(const std::string& match, const std::vector<std::string>& allow_list) {
    std::string m = lower(match);
    return std::any_of(allow_list.begin(), allow_list.end(), [&](const std::string& term) {
        std::string t = lower(term);
        return m.find(t) != std::string::npos || t.find(m) != std::string::npos;
    });
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string mask(const std::string& text, char replacement) {
    std::string out = text;
    for (auto& c : out) {
        if (std::isalnum(static_cast<unsigned char>(c))) c = replacement;
    }
    return out;
}

size_t word_count(const std::string& s) {
    std::istringstream in(s);
    return static_cast<size_t>(std::distance(std::istream_iterator<std::string>(in),
                                             std::istream_iterator<std::string>()));
}

nlohmann::json run(const nlohmann::json& input) {
    std::string text = input.value("text", std::string());
    std::string level = input.value("redaction_level", std::string("standard"));
    auto phi_categories = input.value("phi_categories", std::vector<std::string>{});
    auto allow_list = input.value("allow_list", std::vector<std::string>{});
    auto custom = input.value("custom_patterns", std::vector<std::string>{});
    std::string replacement = input.value("replacement_char", std::string("X"));
    bool preserve = input.value("preserve_structure", true);
    std::string output_format = input.value("output_format", std::string("both"));

    if (text.empty()) {
        return nlohmann::json{{"success", false}, {"error", "text is required for redaction"}};
    }

    std::vector<Pattern> patterns;
    for (const auto& category : level_categories(level)) {
        if (!phi_categories.empty() &&
            std::find(phi_categories.begin(), phi_categories.end(), category) == phi_categories.end()) {
            continue;
        }
        const auto& group = base_patterns().at(category);
        patterns.insert(patterns.end(), group.begin(), group.end());
    }
    try {
        for (const auto& expr : custom) {
            patterns.push_back(make("custom", "Custom pattern", "medium", expr));
        }
    } catch (const std::regex_error& e) {
        return nlohmann::json{{"success", false},
                              {"error", std::string("Invalid custom pattern: ") + e.what()}};
    }

    const char fill = replacement.empty() ? 'X' : replacement[0];
    std::string redacted = text;
    std::vector<Redaction> redactions;
    for (const auto& pattern : patterns) {
        std::vector<std::pair<size_t, size_t>> spans;
        for (auto it = std::sregex_iterator(redacted.begin(), redacted.end(), pattern.re);
             it != std::sregex_iterator(); ++it) {
            spans.emplace_back(static_cast<size_t>(it->position()), static_cast<size_t>(it->length()));
        }
        // Back to front so earlier offsets stay valid.
        for (auto s = spans.rbegin(); s != spans.rend(); ++s) {
            std::string match = redacted.substr(s->first, s->second);
            if (match.empty() || allowed(match, allow_list)) continue;
            std::string repl = preserve ? mask(match, fill) : upper("[" + pattern.category + "_REDACTED]");
            redacted.replace(s->first, s->second, repl);
            redactions.push_back({match, repl, &pattern, s->first, s->first + s->second});
        }
    }

    size_t redacted_chars = 0;
    std::map<std::string, int> by_category, by_risk;
    nlohmann::json annotations = nlohmann::json::array();
    nlohmann::json high_risk = nlohmann::json::array();
    std::set<std::string> categories;
    for (size_t i = 0; i < redactions.size(); ++i) {
        const auto& r = redactions[i];
        redacted_chars += r.original.size();
        by_category[r.pattern->category]++;
        by_risk[r.pattern->risk]++;
        categories.insert(r.pattern->category);
        nlohmann::json a = {
            {"id", "redaction_" + std::to_string(i + 1)},
            {"category", r.pattern->category},
            {"description", r.pattern->description},
            {"risk_level", r.pattern->risk},
            {"start_position", r.start},
            {"end_position", r.end},
            {"original_length", r.original.size()},
            {"redaction_reason", "PHI/" + r.pattern->category + " detected"}
        };
        if (r.pattern->risk == "high") high_risk.push_back(a);
        annotations.push_back(std::move(a));
    }

    double percentage = std::round(static_cast<double>(redacted_chars) * 10000.0 /
                                   static_cast<double>(text.size())) / 100.0;
    nlohmann::json result = {
        {"success", true},
        {"redaction_level", level},
        {"statistics", {
            {"original_length", text.size()},
            {"redacted_length", redacted.size()},
            {"characters_redacted", redacted_chars},
            {"redaction_percentage", percentage},
            {"total_redactions", redactions.size()},
            {"redactions_by_category", by_category},
            {"redactions_by_risk_level", by_risk},
            {"words_original", word_count(text)},
            {"words_redacted", word_count(redacted)}
        }},
        {"redaction_summary", {
            {"total_redactions", redactions.size()},
            {"categories_redacted", categories},
            {"redaction_density", percentage},
            {"high_risk_items", std::move(high_risk)}
        }}
    };
    if (output_format == "redacted_text" || output_format == "both") {
        result["redacted_text"] = redacted;
    }
    if (output_format == "annotations" || output_format == "both") {
        result["annotations"] = std::move(annotations);
    }
    return result;
}

} // namespace

ToolModule document_redaction_tool_module() {
    ToolModule m;
    m.stem = "document_redaction_tool";
    m.docstring = R"(
        Redacts confidential information from clinical documents while preserving document structure.

        Example:
            Input: Document text with subject IDs, names, and contact information to be redacted
            Output: Redacted document with sensitive information masked using the replacement character

        Parameters:
            text : str
                Document text content to redact
            redaction_level : str, optional
                Redaction intensity ('minimal', 'standard', 'maximum') (default: 'standard')
            custom_patterns : list, optional
                Custom regex patterns for redaction
            preserve_structure : bool, optional
                Mask characters in place instead of inserting category tags (default: True)
            replacement_char : str, optional
                Character for redaction (default 'X')
            phi_categories : list, optional
                PHI categories to redact
            allow_list : list, optional
                Terms to never redact
            output_format : str, optional
                Output format ('redacted_text', 'annotations', 'both') (default: 'both')
    )";
    m.load = [] { return ToolEntryPoint(run); };
    return m;
}

} // namespace tools
} // namespace clinmcp
