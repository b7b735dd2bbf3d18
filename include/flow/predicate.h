#pragma once

#include "errors.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace callroute {
namespace flow {

enum class PredicateKind {
    Always,    ///< "always"
    Variable,  ///< Bare identifier, truthy test
    Not,       ///< !x
    And,       ///< a && b && ...
    Or,        ///< a || b || ...
    Compare    ///< identifier op literal
};

const char* predicate_kind_name(PredicateKind kind);

/**
 * @brief Parsed edge condition
 *
 * Declarative only: the graph stores and exports these, the runtime
 * evaluates its own signals.
 */
struct Predicate {
    PredicateKind kind = PredicateKind::Always;
    std::string variable;              ///< Variable, Compare
    std::string op;                    ///< Compare: === !== == != >= <= > <
    nlohmann::json literal;            ///< Compare: bool, number, string or identifier name
    std::vector<Predicate> children;   ///< Not (one), And, Or

    nlohmann::json to_json() const;

    /// Canonical text form, fully parenthesized for nested And/Or
    std::string to_string() const;

    /// Every identifier referenced, in order of first appearance
    std::vector<std::string> variables() const;
};

/**
 * @brief Parse an edge condition
 *
 * Grammar:
 *   or      := and ('||' and)*
 *   and     := unary ('&&' unary)*
 *   unary   := '!' unary | '(' or ')' | operand
 *   operand := IDENT (OP literal)?
 *
 * "always" parses to PredicateKind::Always. Identifiers may contain
 * letters, digits, '_', '.' and '$'.
 */
Result<Predicate> parse_predicate(const std::string& text);

} // namespace flow
} // namespace callroute
