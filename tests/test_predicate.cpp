/**
 * Edge predicate parser tests.
 * Asserts:
 * - Every condition in the shipped flow tree parses.
 * - Precedence: ! binds tighter than &&, && tighter than ||.
 * - Malformed conditions are reported, never thrown.
 *
 * Run from build dir: ./test_predicate
 */

#include "flow/predicate.h"
#include "flow/flow_tree_definition.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

using namespace callroute;
using namespace callroute::flow;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- Simple forms ---
    auto always = parse_predicate("always");
    ASSERT(always.is_ok());
    ASSERT(always.value().kind == PredicateKind::Always);

    auto var = parse_predicate("hasContent");
    ASSERT(var.is_ok());
    ASSERT(var.value().kind == PredicateKind::Variable);
    ASSERT(var.value().variable == "hasContent");

    auto locked = parse_predicate("bookingModeLocked === true");
    ASSERT(locked.is_ok());
    ASSERT(locked.value().kind == PredicateKind::Compare);
    ASSERT(locked.value().variable == "bookingModeLocked");
    ASSERT(locked.value().op == "===");
    ASSERT(locked.value().literal == true);

    // --- Or of three ---
    auto empty = parse_predicate("isEmpty || isPunctuationOnly || isFillerOnly");
    ASSERT(empty.is_ok());
    ASSERT(empty.value().kind == PredicateKind::Or);
    ASSERT(empty.value().children.size() == 3);
    ASSERT(empty.value().variables().size() == 3);

    // --- And with numeric comparison ---
    auto direct = parse_predicate("hasDirectIntent && confidence >= 0.75 && requireExplicitConsent === false");
    ASSERT(direct.is_ok());
    const Predicate& d = direct.value();
    ASSERT(d.kind == PredicateKind::And);
    ASSERT(d.children.size() == 3);
    ASSERT(d.children[1].kind == PredicateKind::Compare);
    ASSERT(d.children[1].op == ">=");
    ASSERT(d.children[1].literal == 0.75);
    ASSERT(d.children[2].literal == false);
    ASSERT(d.to_string() == "hasDirectIntent && confidence >= 0.75 && requireExplicitConsent === false");

    // --- Negation and precedence ---
    auto consent = parse_predicate("noFastPath && !bookingConsentPending");
    ASSERT(consent.is_ok());
    ASSERT(consent.value().children[1].kind == PredicateKind::Not);
    ASSERT(consent.value().children[1].children[0].variable == "bookingConsentPending");

    auto mixed = parse_predicate("a || b && c");
    ASSERT(mixed.is_ok());
    ASSERT(mixed.value().kind == PredicateKind::Or);
    ASSERT(mixed.value().children[1].kind == PredicateKind::And);
    ASSERT(mixed.value().to_string() == "a || (b && c)");

    auto grouped = parse_predicate("(a || b) && !(c)");
    ASSERT(grouped.is_ok());
    ASSERT(grouped.value().kind == PredicateKind::And);
    ASSERT(grouped.value().children[0].kind == PredicateKind::Or);

    // != is a comparison, not a negation
    auto neq = parse_predicate("status != 'closed'");
    ASSERT(neq.is_ok());
    ASSERT(neq.value().kind == PredicateKind::Compare);
    ASSERT(neq.value().op == "!=");
    ASSERT(neq.value().literal == "closed");
    ASSERT(neq.value().to_string() == "status != 'closed'");

    auto count = parse_predicate("retries < 3");
    ASSERT(count.is_ok());
    ASSERT(count.value().literal == 3);
    ASSERT(count.value().literal.is_number_integer());

    auto big_int = parse_predicate("turnCount <= 9223372036854775807");
    ASSERT(big_int.is_ok());
    ASSERT(big_int.value().literal.is_number_integer());
    ASSERT(big_int.value().literal.get<int64_t>() == INT64_MAX);

    auto huge = parse_predicate("turnCount < 99999999999999999999999");
    ASSERT(huge.is_ok());
    ASSERT(huge.value().literal.is_number_float());
    ASSERT(huge.value().literal.get<double>() > 9.9e22);

    auto negative = parse_predicate("delta > -12");
    ASSERT(negative.is_ok());
    ASSERT(negative.value().literal == -12);

    auto dotted = parse_predicate("consentCheck.hasConsent === true");
    ASSERT(dotted.is_ok());
    ASSERT(dotted.value().variable == "consentCheck.hasConsent");

    // --- AST export ---
    json ast = locked.value().to_json();
    ASSERT(ast["kind"] == "compare");
    ASSERT(ast["name"] == "bookingModeLocked");
    ASSERT(ast["op"] == "===");
    ASSERT(ast["value"] == true);
    ASSERT(empty.value().to_json()["args"].size() == 3);

    // --- Malformed ---
    ASSERT(parse_predicate("").is_error());
    ASSERT(parse_predicate("   ").is_error());
    ASSERT(parse_predicate("a &&").is_error());
    ASSERT(parse_predicate("&& a").is_error());
    ASSERT(parse_predicate("(a || b").is_error());
    ASSERT(parse_predicate("a b").is_error());
    ASSERT(parse_predicate("x === 'open").is_error());
    ASSERT(parse_predicate("x >= 1.2.3").is_error());
    ASSERT(parse_predicate("x = 1").is_error());
    auto bad = parse_predicate("a &&");
    ASSERT(bad.error().type == ErrorType::ParseError);
    ASSERT(!bad.error().message.empty());

    // --- Every shipped condition parses ---
    for (const auto& edge : default_flow_graph().edges()) {
        ASSERT(parse_predicate(edge.when).is_ok());
        ASSERT(edge.predicate.has_value());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All predicate tests passed.\n";
    return 0;
}
