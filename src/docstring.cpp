#include "clinmcp/docstring.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace clinmcp {

namespace {

enum class Section { None, Example, Parameters, Other };

std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

size_t indent_of(const std::string& s) {
    size_t n = 0;
    while (n < s.size() && s[n] == ' ') ++n;
    return n;
}

bool is_identifier(const std::string& s) {
    if (s.empty() || !(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

// Splits into lines, expands tabs and removes the common indentation of every
// line after the first, then drops leading and trailing blank lines.
std::vector<std::string> clean_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::string cur;
    for (char c : text) {
        if (c == '\n') {
            lines.push_back(std::move(cur));
            cur.clear();
        } else if (c == '\t') {
            cur.append(4, ' ');
        } else if (c != '\r') {
            cur.push_back(c);
        }
    }
    lines.push_back(std::move(cur));

    size_t margin = std::string::npos;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (!is_blank(lines[i])) margin = std::min(margin, indent_of(lines[i]));
    }
    lines[0] = trim(lines[0]);
    for (size_t i = 1; i < lines.size(); ++i) {
        if (is_blank(lines[i])) {
            lines[i].clear();
        } else if (margin != std::string::npos) {
            lines[i] = lines[i].substr(margin);
        }
    }

    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    auto first = std::find_if(lines.begin(), lines.end(),
                              [](const std::string& l) { return !l.empty(); });
    lines.erase(lines.begin(), first);
    return lines;
}

// "Parameters:" -> "Parameters". Only a bare word (or words) and a colon.
std::optional<std::string> section_name(const std::string& trimmed) {
    if (trimmed.size() < 2 || trimmed.back() != ':') return std::nullopt;
    if (!std::isalpha(static_cast<unsigned char>(trimmed[0]))) return std::nullopt;
    for (size_t i = 0; i + 1 < trimmed.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(trimmed[i]);
        if (!std::isalpha(c) && c != ' ') return std::nullopt;
    }
    return trimmed.substr(0, trimmed.size() - 1);
}

Section classify(const std::string& name) {
    std::string n = lower(name);
    if (n == "example" || n == "examples") return Section::Example;
    if (n == "parameters" || n == "params") return Section::Parameters;
    return Section::Other;
}

// Finds "(default: v)" or "(default v)"; returns the literal and erases the
// annotation from `text`.
std::optional<std::string> take_default(std::string& text) {
    static const std::regex re(R"(\(\s*default\s*[:=]?\s*([^)]*)\))", std::regex::icase);
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    std::string literal = trim(m[1].str());
    text = trim(m.prefix().str() + m.suffix().str());
    return literal;
}

// Splits on commas outside brackets, so "Dict[str, Any], optional" gives two parts.
std::vector<std::string> split_top_level(const std::string& s) {
    std::vector<std::string> parts;
    std::string cur;
    int depth = 0;
    for (char c : s) {
        if (c == '[' || c == '(') ++depth;
        if (c == ']' || c == ')') depth = std::max(0, depth - 1);
        if (c == ',' && depth == 0) {
            parts.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!trim(cur).empty()) parts.push_back(trim(cur));
    return parts;
}

std::optional<ToolParameter> parse_parameter_line(const std::string& trimmed) {
    auto colon = trimmed.find(':');
    if (colon == std::string::npos) return std::nullopt;

    ToolParameter p;
    p.name = trim(std::string_view(trimmed).substr(0, colon));
    if (!is_identifier(p.name)) return std::nullopt;

    std::string rest = trim(std::string_view(trimmed).substr(colon + 1));
    if (auto literal = take_default(rest)) {
        p.default_value = DocstringParser::parse_default(*literal);
        p.required = false;
    }

    auto parts = split_top_level(rest);
    p.type = parts.empty() ? "any" : DocstringParser::map_type(parts[0]);
    for (size_t i = 1; i < parts.size(); ++i) {
        if (lower(parts[i]).find("optional") != std::string::npos) p.required = false;
    }
    return p;
}

void finish_parameter(std::optional<ToolParameter>& cur, std::vector<ToolParameter>& out) {
    if (!cur) return;
    if (!cur->default_value) {
        if (auto literal = take_default(cur->description)) {
            cur->default_value = DocstringParser::parse_default(*literal);
            cur->required = false;
        }
    }
    cur->description = trim(cur->description);
    auto dup = std::find_if(out.begin(), out.end(),
                            [&](const ToolParameter& p) { return p.name == cur->name; });
    if (dup == out.end()) out.push_back(std::move(*cur));
    cur.reset();
}

std::vector<ToolParameter> parse_parameters(const std::vector<std::string>& block) {
    size_t base = std::string::npos;
    for (const auto& line : block) {
        if (!is_blank(line)) base = std::min(base, indent_of(line));
    }

    std::vector<ToolParameter> params;
    std::optional<ToolParameter> cur;
    for (const auto& line : block) {
        if (is_blank(line)) continue;
        std::string t = trim(line);
        if (indent_of(line) <= base) {
            finish_parameter(cur, params);
            cur = parse_parameter_line(t);
        } else if (cur) {
            if (!cur->description.empty()) cur->description += ' ';
            cur->description += t;
        }
    }
    finish_parameter(cur, params);
    return params;
}

void parse_example(const std::vector<std::string>& block, ToolDoc& doc) {
    size_t margin = std::string::npos;
    for (const auto& line : block) {
        if (!is_blank(line)) margin = std::min(margin, indent_of(line));
    }
    if (margin == std::string::npos) return;

    std::string text;
    for (const auto& line : block) {
        std::string l = is_blank(line) ? std::string() : line.substr(margin);
        std::string t = trim(l);
        if (t.rfind("Input:", 0) == 0) doc.example_input = trim(std::string_view(t).substr(6));
        if (t.rfind("Output:", 0) == 0) doc.example_output = trim(std::string_view(t).substr(7));
        if (!text.empty()) text += '\n';
        text += l;
    }
    text = trim(text);
    if (!text.empty()) doc.example = std::move(text);
}

} // namespace

ToolDoc DocstringParser::parse(std::string_view docstring) {
    ToolDoc doc;
    auto lines = clean_lines(docstring);
    if (lines.empty()) return doc;

    size_t i = 0;
    if (!section_name(trim(lines[0]))) {
        doc.summary = trim(lines[0]);
        i = 1;
    }

    Section current = Section::None;
    size_t header_indent = 0;
    std::vector<std::string> block;

    auto flush = [&] {
        if (current == Section::Example) parse_example(block, doc);
        if (current == Section::Parameters) doc.parameters = parse_parameters(block);
        block.clear();
    };

    for (; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        size_t indent = indent_of(line);
        std::optional<std::string> header;
        if (!is_blank(line)) header = section_name(trim(line));
        if (header && (current == Section::None || indent <= header_indent)) {
            flush();
            current = classify(*header);
            header_indent = indent;
            continue;
        }
        if (current == Section::Example || current == Section::Parameters) {
            block.push_back(line);
        }
    }
    flush();
    return doc;
}

std::string DocstringParser::map_type(std::string_view token) {
    std::string t = trim(token);
    std::string inner;
    auto bracket = t.find('[');
    if (bracket != std::string::npos) {
        auto close = t.rfind(']');
        if (close != std::string::npos && close > bracket) {
            inner = t.substr(bracket + 1, close - bracket - 1);
        }
        t = trim(std::string_view(t).substr(0, bracket));
    }
    t = lower(t);
    // Optional[int] documents an int
    if (t == "optional" && !inner.empty()) return map_type(inner);

    if (t == "str" || t == "string" || t == "text") return "string";
    if (t == "int" || t == "integer") return "integer";
    if (t == "float" || t == "number" || t == "double") return "number";
    if (t == "bool" || t == "boolean") return "boolean";
    if (t == "dict" || t == "object" || t == "mapping") return "object";
    if (t == "list" || t == "array" || t == "tuple" || t == "sequence") return "array";
    return "any";
}

nlohmann::json DocstringParser::parse_default(std::string_view literal) {
    std::string s = trim(literal);
    if (s == "True" || s == "true") return true;
    if (s == "False" || s == "false") return false;
    if (s == "None" || s == "null") return nullptr;
    if (s.size() >= 2 && (s.front() == '\'' || s.front() == '"') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    auto j = nlohmann::json::parse(s, nullptr, false);
    if (!j.is_discarded()) return j;
    return s;
}

nlohmann::json DocstringParser::permissive_schema() {
    return nlohmann::json{
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"additionalProperties", true}
    };
}

nlohmann::json DocstringParser::to_input_schema(const std::vector<ToolParameter>& params) {
    if (params.empty()) return permissive_schema();

    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& p : params) {
        nlohmann::json prop = nlohmann::json::object();
        if (p.type != "any") prop["type"] = p.type;
        if (!p.description.empty()) prop["description"] = p.description;
        if (p.default_value) prop["default"] = *p.default_value;
        properties[p.name] = std::move(prop);
        if (p.required) required.push_back(p.name);
    }
    return nlohmann::json{
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

} // namespace clinmcp
