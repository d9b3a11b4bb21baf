#include "detect/PythonSyntax.hpp"
#include "core/SyntaxNode.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace mcpify::python {

namespace {

std::string trim(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(start, end - start));
}

size_t indentation(std::string_view line) {
    size_t count = 0;
    while (count < line.size() && (line[count] == ' ' || line[count] == '\t')) {
        ++count;
    }
    return count;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream in{std::string(text)};
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// Splits on separators that are not nested inside brackets.
std::vector<std::string> split_top_level(std::string_view text, char separator) {
    std::vector<std::string> parts;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '[' || c == '(') {
            ++depth;
        } else if (c == ']' || c == ')') {
            --depth;
        } else if (c == separator && depth == 0) {
            parts.push_back(trim(text.substr(start, i - start)));
            start = i + 1;
        }
    }
    parts.push_back(trim(text.substr(start)));
    return parts;
}

std::string unescape(std::string_view body) {
    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out.push_back(c);
            continue;
        }
        char next = body[++i];
        switch (next) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case '\\': out.push_back('\\'); break;
            case '\'': out.push_back('\''); break;
            case '"': out.push_back('"'); break;
            case '\n': break;  // line continuation
            default:
                out.push_back('\\');
                out.push_back(next);
                break;
        }
    }
    return out;
}

std::optional<std::string> single_string_literal(std::string_view raw) {
    size_t prefix_len = 0;
    bool is_raw = false;
    while (prefix_len < raw.size() && std::isalpha(static_cast<unsigned char>(raw[prefix_len]))) {
        char p = static_cast<char>(std::tolower(static_cast<unsigned char>(raw[prefix_len])));
        if (p == 'f') {
            return std::nullopt;
        }
        if (p == 'r') {
            is_raw = true;
        }
        ++prefix_len;
    }
    std::string_view quoted = raw.substr(prefix_len);

    size_t quote_len = 0;
    if (quoted.size() >= 6 && (quoted.substr(0, 3) == "\"\"\"" || quoted.substr(0, 3) == "'''")) {
        quote_len = 3;
    } else if (quoted.size() >= 2 && (quoted.front() == '"' || quoted.front() == '\'')) {
        quote_len = 1;
    } else {
        return std::nullopt;
    }

    std::string_view body = quoted.substr(quote_len, quoted.size() - 2 * quote_len);
    return is_raw ? std::string(body) : unescape(body);
}

std::string clean_docstring(std::string_view raw) {
    auto lines = split_lines(raw);
    if (lines.empty()) {
        return "";
    }

    size_t common = std::string::npos;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) {
            continue;
        }
        common = std::min(common, indentation(lines[i]));
    }

    std::vector<std::string> cleaned;
    cleaned.push_back(trim(lines[0]));
    for (size_t i = 1; i < lines.size(); ++i) {
        std::string line = lines[i];
        if (common != std::string::npos && line.size() >= common) {
            line = line.substr(common);
        }
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
            line.pop_back();
        }
        cleaned.push_back(line);
    }

    while (!cleaned.empty() && cleaned.front().empty()) {
        cleaned.erase(cleaned.begin());
    }
    while (!cleaned.empty() && cleaned.back().empty()) {
        cleaned.pop_back();
    }

    std::string result;
    for (size_t i = 0; i < cleaned.size(); ++i) {
        if (i > 0) {
            result += "\n";
        }
        result += cleaned[i];
    }
    return result;
}

std::optional<json> integer_literal(std::string text) {
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
    int base = 10;
    std::string digits = text;
    if (text.size() > 2 && text[0] == '0') {
        char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
        if (marker == 'x') base = 16;
        if (marker == 'o') base = 8;
        if (marker == 'b') base = 2;
        if (base != 10) digits = text.substr(2);
    }
    if (!digits.empty() && (digits.back() == 'l' || digits.back() == 'L')) {
        digits.pop_back();
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(digits.c_str(), &end, base);
    if (errno != 0 || end == digits.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return json(value);
}

std::optional<json> float_literal(std::string text) {
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
    if (!text.empty() && (text.back() == 'j' || text.back() == 'J')) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return json(value);
}

} // namespace

std::optional<std::string> string_literal(TSNode node, std::string_view source) {
    if (syntax::is(node, "string")) {
        return single_string_literal(syntax::text(node, source));
    }
    if (syntax::is(node, "concatenated_string")) {
        std::string joined;
        for (TSNode part : syntax::named_children(node)) {
            if (syntax::is(part, "comment")) {
                continue;
            }
            auto value = string_literal(part, source);
            if (!value) {
                return std::nullopt;
            }
            joined += *value;
        }
        return joined;
    }
    return std::nullopt;
}

std::optional<json> literal_value(TSNode node, std::string_view source) {
    std::string_view kind = syntax::type(node);

    if (kind == "integer") {
        return integer_literal(syntax::text(node, source));
    }
    if (kind == "float") {
        return float_literal(syntax::text(node, source));
    }
    if (kind == "string" || kind == "concatenated_string") {
        auto value = string_literal(node, source);
        if (!value) {
            return std::nullopt;
        }
        return json(*value);
    }
    if (kind == "true") {
        return json(true);
    }
    if (kind == "false") {
        return json(false);
    }
    if (kind == "none") {
        return json(nullptr);
    }
    if (kind == "parenthesized_expression") {
        auto children = syntax::named_children(node);
        if (children.size() == 1) {
            return literal_value(children[0], source);
        }
        return std::nullopt;
    }
    if (kind == "unary_operator") {
        std::string op = syntax::text(syntax::field(node, "operator"), source);
        auto operand = literal_value(syntax::field(node, "argument"), source);
        if (!operand || !operand->is_number()) {
            return std::nullopt;
        }
        if (op == "+") {
            return operand;
        }
        if (op == "-") {
            if (operand->is_number_float()) {
                return json(-operand->get<double>());
            }
            return json(-operand->get<long long>());
        }
        return std::nullopt;
    }
    if (kind == "list" || kind == "tuple" || kind == "set") {
        json items = json::array();
        for (TSNode child : syntax::named_children(node)) {
            if (syntax::is(child, "comment")) {
                continue;
            }
            auto value = literal_value(child, source);
            if (!value) {
                return std::nullopt;
            }
            items.push_back(*value);
        }
        return items;
    }

    return std::nullopt;
}

ParamType type_of_literal(const json& value) {
    if (value.is_boolean()) return ParamType::Boolean;
    if (value.is_number_integer()) return ParamType::Integer;
    if (value.is_number_float()) return ParamType::Number;
    if (value.is_array()) return ParamType::Array;
    return ParamType::String;
}

std::optional<ParamType> type_from_name(std::string_view name) {
    if (name == "int") return ParamType::Integer;
    if (name == "float") return ParamType::Number;
    if (name == "bool") return ParamType::Boolean;
    if (name == "str" || name == "string" || name == "path" || name == "uuid" ||
        name == "Path" || name == "pathlib.Path") {
        return ParamType::String;
    }
    if (name == "list") return ParamType::Array;
    return std::nullopt;
}

std::optional<ParamType> type_from_annotation(std::string_view annotation) {
    std::string text = trim(annotation);
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        text = trim(std::string_view(text).substr(1, text.size() - 2));
    }
    if (text.rfind("typing.", 0) == 0) {
        text = text.substr(7);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    // X | None and Union[X, None]
    auto alternatives = split_top_level(text, '|');
    if (alternatives.size() > 1) {
        std::vector<std::string> kept;
        for (auto& alt : alternatives) {
            if (alt != "None") kept.push_back(alt);
        }
        return kept.size() == 1 ? type_from_annotation(kept[0]) : std::nullopt;
    }

    size_t bracket = text.find('[');
    std::string head = bracket == std::string::npos ? text : trim(std::string_view(text).substr(0, bracket));
    std::string inner;
    if (bracket != std::string::npos && text.back() == ']') {
        inner = text.substr(bracket + 1, text.size() - bracket - 2);
    }

    if (head == "Optional" || head == "Annotated") {
        auto parts = split_top_level(inner, ',');
        return parts.empty() ? std::nullopt : type_from_annotation(parts[0]);
    }
    if (head == "Union") {
        std::vector<std::string> kept;
        for (auto& part : split_top_level(inner, ',')) {
            if (part != "None") kept.push_back(part);
        }
        return kept.size() == 1 ? type_from_annotation(kept[0]) : std::nullopt;
    }

    static const char* kSequences[] = {"list", "List", "tuple", "Tuple", "set", "Set",
                                       "frozenset", "FrozenSet", "Sequence", "Iterable",
                                       "collections.abc.Sequence"};
    for (const char* name : kSequences) {
        if (head == name) {
            return ParamType::Array;
        }
    }

    return type_from_name(head);
}

std::vector<TSNode> positional_arguments(TSNode argument_list) {
    std::vector<TSNode> args;
    for (TSNode child : syntax::named_children(argument_list)) {
        std::string_view kind = syntax::type(child);
        if (kind == "keyword_argument" || kind == "comment" ||
            kind == "list_splat" || kind == "dictionary_splat") {
            continue;
        }
        args.push_back(child);
    }
    return args;
}

std::vector<std::pair<std::string, TSNode>> keyword_arguments(TSNode argument_list, std::string_view source) {
    std::vector<std::pair<std::string, TSNode>> args;
    for (TSNode child : syntax::named_children(argument_list)) {
        if (!syntax::is(child, "keyword_argument")) {
            continue;
        }
        args.emplace_back(syntax::text(syntax::field(child, "name"), source),
                          syntax::field(child, "value"));
    }
    return args;
}

std::optional<TSNode> keyword_argument(TSNode argument_list, std::string_view name, std::string_view source) {
    for (const auto& [key, value] : keyword_arguments(argument_list, source)) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<FormalParameter> formal_parameters(TSNode function_definition, std::string_view source) {
    std::vector<FormalParameter> result;
    TSNode params = syntax::field(function_definition, "parameters");

    for (TSNode child : syntax::named_children(params)) {
        std::string_view kind = syntax::type(child);
        FormalParameter param;

        if (kind == "identifier") {
            param.name = syntax::text(child, source);
        } else if (kind == "typed_parameter") {
            auto children = syntax::named_children(child);
            if (children.empty() || !syntax::is(children[0], "identifier")) {
                continue;  // *args: T / **kwargs: T
            }
            param.name = syntax::text(children[0], source);
            TSNode annotation = syntax::field(child, "type");
            if (!syntax::is_null(annotation)) {
                param.annotation = syntax::text(annotation, source);
            }
        } else if (kind == "default_parameter" || kind == "typed_default_parameter") {
            TSNode name = syntax::field(child, "name");
            if (!syntax::is(name, "identifier")) {
                continue;
            }
            param.name = syntax::text(name, source);
            TSNode annotation = syntax::field(child, "type");
            if (!syntax::is_null(annotation)) {
                param.annotation = syntax::text(annotation, source);
            }
            param.has_default = true;
            param.default_node = syntax::field(child, "value");
        } else {
            continue;
        }

        if (param.name == "self" || param.name == "cls") {
            continue;
        }
        result.push_back(std::move(param));
    }

    return result;
}

std::string docstring(TSNode function_definition, std::string_view source) {
    TSNode body = syntax::field(function_definition, "body");
    for (TSNode statement : syntax::named_children(body)) {
        if (syntax::is(statement, "comment")) {
            continue;
        }
        if (!syntax::is(statement, "expression_statement")) {
            return "";
        }
        auto children = syntax::named_children(statement);
        if (children.empty()) {
            return "";
        }
        auto value = string_literal(children[0], source);
        return value ? clean_docstring(*value) : "";
    }
    return "";
}

std::string leading_comment(TSNode definition, std::string_view source) {
    TSNode anchor = definition;
    TSNode outer = syntax::parent(definition);
    if (syntax::is(outer, "decorated_definition")) {
        anchor = outer;
    }

    std::vector<std::string> lines;
    uint32_t expected_row = ts_node_start_point(anchor).row;
    TSNode sibling = ts_node_prev_named_sibling(anchor);
    while (!syntax::is_null(sibling) && syntax::is(sibling, "comment")) {
        if (ts_node_end_point(sibling).row + 1 != expected_row) {
            break;
        }
        std::string line = syntax::text(sibling, source);
        size_t start = line.find_first_not_of('#');
        lines.push_back(start == std::string::npos ? "" : trim(std::string_view(line).substr(start)));
        expected_row = ts_node_start_point(sibling).row;
        sibling = ts_node_prev_named_sibling(sibling);
    }

    std::reverse(lines.begin(), lines.end());
    std::string result;
    for (const auto& line : lines) {
        if (!result.empty()) {
            result += "\n";
        }
        result += line;
    }
    return trim(result);
}

std::string documentation(TSNode function_definition, std::string_view source) {
    std::string doc = docstring(function_definition, source);
    if (!doc.empty()) {
        return doc;
    }
    return leading_comment(function_definition, source);
}

std::string summary(std::string_view doc) {
    std::string result;
    for (const auto& line : split_lines(doc)) {
        std::string stripped = trim(line);
        if (stripped.empty()) {
            if (!result.empty()) {
                break;
            }
            continue;
        }
        if (!result.empty()) {
            result += " ";
        }
        result += stripped;
    }
    return result;
}

std::map<std::string, std::string> parameter_docs(std::string_view doc) {
    std::map<std::string, std::string> docs;
    auto lines = split_lines(doc);

    static const std::regex sphinx(R"(^\s*:param\s+(?:[\w\[\], ]+\s+)?(\w+)\s*:\s*(.*)$)");
    static const std::regex section(R"(^\s*(Args|Arguments|Parameters|Params)\s*:\s*$)");
    static const std::regex entry(R"(^\s*\*{0,2}(\w+)\s*(?:\([^)]*\))?\s*:\s*(.*)$)");

    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch m;
        if (std::regex_match(lines[i], m, sphinx)) {
            docs[m[1].str()] = trim(m[2].str());
            continue;
        }
        if (!std::regex_match(lines[i], section)) {
            continue;
        }

        size_t header_indent = indentation(lines[i]);
        size_t entry_indent = std::string::npos;
        std::string current;
        for (size_t j = i + 1; j < lines.size(); ++j) {
            const std::string& line = lines[j];
            if (trim(line).empty()) {
                continue;
            }
            size_t indent = indentation(line);
            if (indent <= header_indent) {
                break;
            }
            if (entry_indent == std::string::npos) {
                entry_indent = indent;
            }
            std::smatch em;
            if (indent == entry_indent && std::regex_match(line, em, entry)) {
                current = em[1].str();
                docs[current] = trim(em[2].str());
            } else if (indent > entry_indent && !current.empty()) {
                std::string& text = docs[current];
                text += (text.empty() ? "" : " ") + trim(line);
            }
            i = j;
        }
    }

    return docs;
}

std::string humanize(std::string_view identifier) {
    std::vector<std::string> words;
    std::string word;
    for (size_t i = 0; i < identifier.size(); ++i) {
        char c = identifier[i];
        if (c == '_' || c == '-' || c == ' ' || c == '.') {
            if (!word.empty()) {
                words.push_back(word);
                word.clear();
            }
            continue;
        }
        bool upper = std::isupper(static_cast<unsigned char>(c));
        bool prev_lower = i > 0 && std::islower(static_cast<unsigned char>(identifier[i - 1]));
        if (upper && prev_lower && !word.empty()) {
            words.push_back(word);
            word.clear();
        }
        word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (!word.empty()) {
        words.push_back(word);
    }

    std::string result;
    for (const auto& w : words) {
        if (!result.empty()) {
            result += " ";
        }
        result += w;
    }
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::string sanitize_identifier(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result.push_back(std::isalnum(static_cast<unsigned char>(c)) || c == '_' ? c : '_');
    }
    if (result.empty()) {
        return "tool";
    }
    if (std::isdigit(static_cast<unsigned char>(result[0]))) {
        result.insert(result.begin(), '_');
    }
    return result;
}

} // namespace mcpify::python
