#include "flow/predicate.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>

using json = nlohmann::json;

namespace callroute {
namespace flow {

const char* predicate_kind_name(PredicateKind kind) {
    switch (kind) {
        case PredicateKind::Always: return "always";
        case PredicateKind::Variable: return "var";
        case PredicateKind::Not: return "not";
        case PredicateKind::And: return "and";
        case PredicateKind::Or: return "or";
        case PredicateKind::Compare: return "compare";
    }
    return "always";
}

json Predicate::to_json() const {
    json j;
    j["kind"] = predicate_kind_name(kind);
    switch (kind) {
        case PredicateKind::Always:
            break;
        case PredicateKind::Variable:
            j["name"] = variable;
            break;
        case PredicateKind::Compare:
            j["name"] = variable;
            j["op"] = op;
            j["value"] = literal;
            break;
        case PredicateKind::Not:
        case PredicateKind::And:
        case PredicateKind::Or: {
            json args = json::array();
            for (const auto& child : children) {
                args.push_back(child.to_json());
            }
            j["args"] = args;
            break;
        }
    }
    return j;
}

std::string Predicate::to_string() const {
    switch (kind) {
        case PredicateKind::Always:
            return "always";
        case PredicateKind::Variable:
            return variable;
        case PredicateKind::Compare: {
            std::string value;
            if (literal.is_string()) {
                value = "'" + literal.get<std::string>() + "'";
            } else {
                value = literal.dump();
            }
            return variable + " " + op + " " + value;
        }
        case PredicateKind::Not: {
            const Predicate& inner = children.front();
            bool simple = inner.kind == PredicateKind::Variable || inner.kind == PredicateKind::Not;
            return "!" + (simple ? inner.to_string() : "(" + inner.to_string() + ")");
        }
        case PredicateKind::And:
        case PredicateKind::Or: {
            const char* sep = kind == PredicateKind::And ? " && " : " || ";
            std::string out;
            for (size_t i = 0; i < children.size(); ++i) {
                const Predicate& c = children[i];
                bool nested = c.kind == PredicateKind::And || c.kind == PredicateKind::Or;
                if (i > 0) out += sep;
                out += nested ? "(" + c.to_string() + ")" : c.to_string();
            }
            return out;
        }
    }
    return "always";
}

namespace {

void collect_variables(const Predicate& p, std::vector<std::string>& out) {
    if (p.kind == PredicateKind::Variable || p.kind == PredicateKind::Compare) {
        for (const auto& v : out) {
            if (v == p.variable) return;
        }
        out.push_back(p.variable);
        return;
    }
    for (const auto& child : p.children) {
        collect_variables(child, out);
    }
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '.';
}

/// Recursive-descent parser over the raw text; errors carry the column
class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    Result<Predicate> parse() {
        skip_ws();
        if (pos_ >= text_.size()) {
            return make_parse_error("empty predicate");
        }
        Predicate root;
        if (!parse_or(root)) {
            return make_parse_error(error_);
        }
        skip_ws();
        if (pos_ < text_.size()) {
            return make_parse_error("unexpected '" + text_.substr(pos_, 1) + "' at column " + std::to_string(pos_ + 1));
        }
        return root;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    std::string error_;

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }
    }

    bool consume(const char* token) {
        skip_ws();
        size_t len = std::char_traits<char>::length(token);
        if (text_.compare(pos_, len, token) == 0) {
            pos_ += len;
            return true;
        }
        return false;
    }

    bool fail(const std::string& message) {
        if (error_.empty()) {
            error_ = message + " at column " + std::to_string(pos_ + 1);
        }
        return false;
    }

    bool parse_or(Predicate& out) {
        Predicate first;
        if (!parse_and(first)) return false;
        if (!consume("||")) {
            out = std::move(first);
            return true;
        }
        out = Predicate{};
        out.kind = PredicateKind::Or;
        out.children.push_back(std::move(first));
        do {
            Predicate next;
            if (!parse_and(next)) return false;
            out.children.push_back(std::move(next));
        } while (consume("||"));
        return true;
    }

    bool parse_and(Predicate& out) {
        Predicate first;
        if (!parse_unary(first)) return false;
        if (!consume("&&")) {
            out = std::move(first);
            return true;
        }
        out = Predicate{};
        out.kind = PredicateKind::And;
        out.children.push_back(std::move(first));
        do {
            Predicate next;
            if (!parse_unary(next)) return false;
            out.children.push_back(std::move(next));
        } while (consume("&&"));
        return true;
    }

    bool parse_unary(Predicate& out) {
        skip_ws();
        if (pos_ >= text_.size()) {
            return fail("unexpected end of predicate");
        }
        // '!' but not '!=' / '!=='
        if (text_[pos_] == '!' && (pos_ + 1 >= text_.size() || text_[pos_ + 1] != '=')) {
            pos_++;
            Predicate inner;
            if (!parse_unary(inner)) return false;
            out = Predicate{};
            out.kind = PredicateKind::Not;
            out.children.push_back(std::move(inner));
            return true;
        }
        if (text_[pos_] == '(') {
            pos_++;
            if (!parse_or(out)) return false;
            if (!consume(")")) {
                return fail("expected ')'");
            }
            return true;
        }
        return parse_operand(out);
    }

    bool parse_identifier(std::string& name) {
        skip_ws();
        if (pos_ >= text_.size() || !is_ident_start(text_[pos_])) {
            return fail("expected identifier");
        }
        size_t start = pos_;
        while (pos_ < text_.size() && is_ident_char(text_[pos_])) {
            pos_++;
        }
        name = text_.substr(start, pos_ - start);
        return true;
    }

    bool parse_compare_op(std::string& op) {
        static const char* ops[] = {"===", "!==", "==", "!=", ">=", "<=", ">", "<"};
        for (const char* candidate : ops) {
            if (consume(candidate)) {
                op = candidate;
                return true;
            }
        }
        return false;
    }

    bool parse_literal(json& value) {
        skip_ws();
        if (pos_ >= text_.size()) {
            return fail("expected literal");
        }
        char c = text_[pos_];
        if (c == '\'' || c == '"') {
            size_t end = text_.find(c, pos_ + 1);
            if (end == std::string::npos) {
                return fail("unterminated string literal");
            }
            value = text_.substr(pos_ + 1, end - pos_ - 1);
            pos_ = end + 1;
            return true;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '.') {
            size_t start = pos_;
            if (c == '-') pos_++;
            while (pos_ < text_.size()
                   && (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
                pos_++;
            }
            std::string number = text_.substr(start, pos_ - start);
            char* end = nullptr;
            double d = std::strtod(number.c_str(), &end);
            if (number.empty() || number == "-" || end != number.c_str() + number.size()) {
                pos_ = start;
                return fail("malformed number");
            }
            if (number.find('.') == std::string::npos) {
                // Integers beyond int64 stay doubles
                errno = 0;
                long long i = std::strtoll(number.c_str(), nullptr, 10);
                if (errno == ERANGE) {
                    value = d;
                } else {
                    value = static_cast<int64_t>(i);
                }
            } else {
                value = d;
            }
            return true;
        }
        std::string ident;
        if (!parse_identifier(ident)) return false;
        if (ident == "true") value = true;
        else if (ident == "false") value = false;
        else if (ident == "null") value = nullptr;
        else value = ident;
        return true;
    }

    bool parse_operand(Predicate& out) {
        std::string name;
        if (!parse_identifier(name)) return false;

        out = Predicate{};
        std::string op;
        if (parse_compare_op(op)) {
            out.kind = PredicateKind::Compare;
            out.variable = name;
            out.op = op;
            return parse_literal(out.literal);
        }
        if (name == "always") {
            out.kind = PredicateKind::Always;
            return true;
        }
        out.kind = PredicateKind::Variable;
        out.variable = name;
        return true;
    }
};

} // namespace

std::vector<std::string> Predicate::variables() const {
    std::vector<std::string> out;
    collect_variables(*this, out);
    return out;
}

Result<Predicate> parse_predicate(const std::string& text) {
    Parser parser(text);
    return parser.parse();
}

} // namespace flow
} // namespace callroute
