#pragma once

#include "config.h"
#include "scenario/raw_scenario.h"
#include "scenario/runtime_spec.h"
#include <string>
#include <optional>
#include <cstdint>

namespace callroute {
namespace scenario {

/// Provenance and clock inputs attached at compile time
struct CompileOptions {
    std::string template_id;
    std::string category_name;
    /// When set, stamped into meta.compiled_at_ms so repeated compiles are identical.
    /// The pool compiler sets one value for the whole pool.
    std::optional<int64_t> compiled_at_ms;
};

/**
 * @brief Compile one raw scenario into its runtime form
 *
 * Total: every field falls back to a safe default and a bad regex trigger is
 * dropped with a warning. Apart from meta.compile_time_ms the result depends
 * only on the inputs.
 */
RuntimeSpec compile_scenario(const RawScenario& raw,
                             const CompileOptions& options = {},
                             const CompilerConfig& config = {});

/**
 * @brief Compile one regex trigger, case-insensitive
 * @return nullopt when the pattern is empty, too long, backtracking-prone or invalid
 */
std::optional<CompiledRegex> compile_regex_trigger(const std::string& pattern,
                                                   size_t max_length = 512);

/**
 * @brief Screen for nested quantifiers such as (a+)+ or (\w*)*
 *
 * std::regex cannot be interrupted, so patterns that can backtrack
 * exponentially are rejected before compilation.
 */
bool is_backtracking_prone(const std::string& pattern);

/// True when any text contains the {name} placeholder (case-insensitive)
bool has_name_placeholder(const std::vector<Reply>& replies);

} // namespace scenario
} // namespace callroute
