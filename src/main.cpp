#include "config.h"
#include "logger.h"
#include "flow/flow_tree_definition.h"
#include "scenario/candidate_lookup.h"
#include "scenario/pool_compiler.h"
#include "scenario/raw_scenario.h"
#include "truth/truth_bundle.h"
#include "truth/wiring_report.h"
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace callroute {

namespace {

void print_usage() {
    std::cerr <<
        "Usage: callroute [--config <path>] [--verbose] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  compile <scenarios.json> [--template <id>]   Compile a pool, print stats and conflicts\n"
        "  lookup <scenarios.json> <utterance...>       Print candidates for one utterance\n"
        "  export <company_id> [--company <file>] [--environment <env>]\n"
        "         [--production] [--allow-degraded]     Print a Truth Bundle\n"
        "  validate <bundle.json>                       Validate a Truth Bundle file\n";
}

bool read_json_file(const std::string& path, json& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Could not open " + path);
        return false;
    }
    try {
        file >> out;
    } catch (const json::exception& e) {
        LOG_ERROR("Error parsing " + path + ": " + std::string(e.what()));
        return false;
    }
    return true;
}

/// Summary of the in-process graph, used when no wiring endpoint is configured
std::shared_ptr<truth::WiringReportSource> local_wiring_source(const flow::FlowGraph& graph) {
    return std::make_shared<truth::FunctionWiringReportSource>(
        [&graph](const truth::WiringRequest& request) {
            return json{
                {"health", {
                    {"status", graph.find_invalid_edges().empty() && graph.find_unreachable_nodes().empty()
                        ? "GREEN" : "RED"},
                    {"unboundNodes", graph.find_unbound_nodes().size()}
                }},
                {"scope", {{"companyId", request.company_id}, {"environment", request.environment}}},
                {"meta", {{"generator", "callroute-local"}, {"flowTreeVersion", graph.version()}}}
            };
        },
        "local");
}

int run_compile(const std::vector<std::string>& args, const Config& config) {
    if (args.empty()) {
        print_usage();
        return 2;
    }
    scenario::CompileOptions options;
    for (size_t i = 1; i + 1 < args.size(); ++i) {
        if (args[i] == "--template") options.template_id = args[++i];
    }

    auto loaded = scenario::load_scenarios_file(args[0]);
    if (loaded.is_error()) {
        LOG_ERROR(loaded.error().describe());
        return 1;
    }

    scenario::CompiledPool pool = scenario::compile_pool(loaded.value(), options, config.compiler);

    json conflicts = json::array();
    for (const auto& c : pool.conflicts) {
        conflicts.push_back(c.to_json());
    }
    json inactive = json::array();
    for (const auto& spec : pool.inactive) {
        inactive.push_back(spec->id);
    }
    json out{
        {"templateId", pool.template_id},
        {"stats", pool.stats.to_json()},
        {"conflicts", conflicts},
        {"inactive", inactive}
    };
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int run_lookup(const std::vector<std::string>& args, const Config& config) {
    if (args.size() < 2) {
        print_usage();
        return 2;
    }
    auto loaded = scenario::load_scenarios_file(args[0]);
    if (loaded.is_error()) {
        LOG_ERROR(loaded.error().describe());
        return 1;
    }

    std::string utterance;
    for (size_t i = 1; i < args.size(); ++i) {
        if (i > 1) utterance += ' ';
        utterance += args[i];
    }

    scenario::CompiledPool pool = scenario::compile_pool(loaded.value(), {}, config.compiler);
    scenario::LookupResult result = scenario::lookup(
        utterance, pool, scenario::LookupLimits::from_config(config.compiler));

    json out = result.to_json();
    out["input"] = utterance;
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int run_export(const std::vector<std::string>& args, const Config& config) {
    truth::ExportOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--production") {
            options.environment = "production";
        } else if (arg == "--allow-degraded") {
            options.allow_degraded = true;
        } else if (arg == "--environment" && i + 1 < args.size()) {
            options.environment = args[++i];
        } else if (arg == "--company" && i + 1 < args.size()) {
            json company;
            if (!read_json_file(args[++i], company)) {
                return 1;
            }
            options.company = company;
        } else if (!options.company_id && arg.rfind("--", 0) != 0) {
            options.company_id = arg;
        } else {
            LOG_ERROR("Unknown export argument: " + arg);
            print_usage();
            return 2;
        }
    }

    const flow::FlowGraph& graph = flow::default_flow_graph();
    std::shared_ptr<truth::WiringReportSource> source;
    if (!config.truth_export.wiring_report_url.empty()) {
        source = std::make_shared<truth::HttpWiringReportSource>(
            config.truth_export.wiring_report_url, config.truth_export.wiring_timeout_ms);
    } else {
        source = local_wiring_source(graph);
    }

    truth::TruthBundleExporter exporter(graph, source, config.truth_export);
    json bundle = exporter.generate(options);
    std::cout << bundle.dump(2) << std::endl;
    return bundle.contains("error") ? 1 : 0;
}

int run_validate(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return 2;
    }
    json bundle;
    if (!read_json_file(args[0], bundle)) {
        return 1;
    }
    truth::BundleValidation result = truth::TruthBundleExporter::validate(bundle);
    std::cout << result.to_json().dump(2) << std::endl;
    return result.valid ? 0 : 1;
}

} // namespace

} // namespace callroute

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    bool verbose = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            callroute::print_usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        callroute::print_usage();
        return 2;
    }

    // Console stays at WARN unless asked, so stdout carries only the JSON result
    callroute::Logger::initialize(callroute::LogLevel::WARN);
    callroute::Config config = callroute::Config::load_from_file(config_path);
    const callroute::LogLevel file_level = callroute::parse_log_level(config.logging.level);
    callroute::LogLevel console_level = file_level;
    if (!verbose && console_level < callroute::LogLevel::WARN) {
        console_level = callroute::LogLevel::WARN;
    }
    callroute::Logger::shutdown();
    callroute::Logger::initialize(console_level, config.logging.file, file_level);

    const std::string command = args.front();
    args.erase(args.begin());

    int result = 2;
    if (command == "compile") {
        result = callroute::run_compile(args, config);
    } else if (command == "lookup") {
        result = callroute::run_lookup(args, config);
    } else if (command == "export") {
        result = callroute::run_export(args, config);
    } else if (command == "validate") {
        result = callroute::run_validate(args);
    } else {
        LOG_ERROR("Unknown command: " + command);
        callroute::print_usage();
    }

    callroute::Logger::shutdown();
    return result;
}
