#include "truth/truth_bundle.h"
#include "truth/sha256.h"
#include "logger.h"
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

using json = nlohmann::json;

namespace callroute {
namespace truth {

const char* integrity_name(Integrity integrity) {
    switch (integrity) {
        case Integrity::Complete: return "COMPLETE";
        case Integrity::Degraded: return "DEGRADED";
        case Integrity::Invalid: return "INVALID";
        case Integrity::Failed: return "FAILED";
    }
    return "FAILED";
}

Integrity downgrade(Integrity current, Integrity floor) {
    return static_cast<int>(floor) > static_cast<int>(current) ? floor : current;
}

json BundleValidation::to_json() const {
    return json{{"valid", valid}, {"errors", errors}};
}

json RuntimeState::to_json() const {
    auto opt = [](const std::optional<std::string>& v) { return v ? json(*v) : json(nullptr); };
    return json{
        {"matchSource", opt(match_source)},
        {"checkpoint", opt(checkpoint)},
        {"branchTaken", opt(branch_taken)}
    };
}

json PathCheck::to_json() const {
    json j{
        {"inTree", in_tree},
        {"flowNodeId", flow_node_id ? json(*flow_node_id) : json(nullptr)}
    };
    if (warning) j["warning"] = *warning;
    return j;
}

namespace {

std::string iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

/// State shared with the wiring worker; outlives a detached thread
struct WiringCall {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::optional<Result<json>> result;
};

json unavailable_report(const std::string& reason) {
    return json{{"status", "UNAVAILABLE"}, {"reason", reason}};
}

std::string join_ids(const json& items) {
    std::string out;
    for (const auto& item : items) {
        std::string id = item.is_string() ? item.get<std::string>()
                       : (item.is_object() && item.contains("id") && item["id"].is_string())
                           ? item["id"].get<std::string>()
                           : item.dump(-1, ' ', false, json::error_handler_t::replace);
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

} // namespace

class TruthBundleExporter::Impl {
public:
    Impl(const flow::FlowGraph& graph, std::shared_ptr<WiringReportSource> source,
         const TruthExportConfig& config)
        : graph_(graph), source_(std::move(source)), config_(config) {}

    json generate(const ExportOptions& options) const {
        const std::string generated_at = iso8601_now();
        const std::string environment = options.environment.empty() ? config_.environment : options.environment;
        const bool allow_degraded = options.allow_degraded.value_or(config_.allow_degraded);

        Integrity integrity = Integrity::Complete;
        std::vector<std::string> errors;

        const bool has_company_id = options.company_id && !options.company_id->empty();
        if (!has_company_id) {
            errors.push_back("companyId is required");
            LOG_WARN("[Truth] Export rejected: companyId is required");
            return envelope(Integrity::Invalid, generated_at, std::nullopt, environment, errors,
                            "Truth export invalid: companyId is required");
        }
        const std::string& company_id = *options.company_id;

        if (environment == "production" && !options.company) {
            integrity = downgrade(integrity, Integrity::Degraded);
            errors.push_back("Company document not supplied for production export");
        }

        json wiring_report = fetch_wiring_report(company_id, environment, options.company, integrity, errors);

        if (integrity != Integrity::Complete && !allow_degraded) {
            std::string reason = std::string("Truth export failed: integrity ") + integrity_name(integrity)
                + " and allowDegraded is false";
            LOG_ERROR("[Truth] " + reason + " company=" + company_id);
            return envelope(Integrity::Failed, generated_at, company_id, environment, errors, reason);
        }

        json body{
            {"wiringReport", wiring_report},
            {"flowTree", graph_.export_flow_tree(generated_at)},
            {"runtimeBindings", graph_.export_runtime_bindings()},
            {"validation", validation_section()}
        };

        auto hash = TruthBundleExporter::compute_hash(body);
        if (hash.is_error()) {
            errors.push_back(hash.error().describe());
            LOG_ERROR("[Truth] " + hash.error().describe());
            return envelope(Integrity::Failed, generated_at, company_id, environment, errors,
                            "Truth export failed: could not hash bundle");
        }

        json meta{
            {"schema", kTruthBundleSchema},
            {"generatedAt", generated_at},
            {"companyId", company_id},
            {"environment", environment},
            {"integrity", integrity_name(integrity)},
            {"hash", hash.value()},
            {"flowTreeVersion", graph_.version()},
            {"nodeCount", graph_.nodes().size()},
            {"edgeCount", graph_.edges().size()},
            {"bindingCount", graph_.bindings().size()}
        };
        if (!errors.empty()) {
            meta["errors"] = errors;
        }

        const json& validation = body["validation"];
        if (!validation["unreachableNodes"].empty() || !validation["invalidEdges"].empty()) {
            LOG_WARN("[Truth] Flow graph has unreachable nodes or invalid edges; bundle will not validate");
        }

        std::ostringstream oss;
        oss << "Bundle generated company=" << company_id
            << " environment=" << environment
            << " integrity=" << integrity_name(integrity)
            << " nodes=" << graph_.nodes().size()
            << " edges=" << graph_.edges().size()
            << " hash=" << hash.value().substr(0, 12);
        LOG_TRUTH(oss.str());

        json bundle = std::move(body);
        bundle["meta"] = std::move(meta);
        return bundle;
    }

    std::optional<std::string> resolve(const RuntimeState& state) const {
        if (state.match_source) {
            if (const auto* node = graph_.find_node_by_match_source(*state.match_source)) {
                return node->id;
            }
        }
        if (state.checkpoint) {
            if (const auto* node = graph_.find_node_by_checkpoint(*state.checkpoint)) {
                return node->id;
            }
        }
        if (state.branch_taken) {
            const std::string& branch = *state.branch_taken;
            if (branch == "BOOKING") return std::string("node.bookingRunner");
            if (branch == "SCENARIO") return std::string("node.scenarioResponse");
            if (branch == "LLM" || branch == "FALLBACK") return std::string("node.llmFallback");
            if (branch == "SILENCE") return std::string("node.silenceHandler");
            if (branch == "META") return std::string("node.metaIntentDetector");
            if (branch == "FAST_PATH") return std::string("node.fastPathOffer");
        }
        return std::nullopt;
    }

private:
    const flow::FlowGraph& graph_;
    std::shared_ptr<WiringReportSource> source_;
    TruthExportConfig config_;

    json envelope(Integrity integrity, const std::string& generated_at,
                  const std::optional<std::string>& company_id, const std::string& environment,
                  const std::vector<std::string>& errors, const std::string& error) const {
        json meta{
            {"schema", kTruthBundleSchema},
            {"generatedAt", generated_at},
            {"companyId", company_id ? json(*company_id) : json(nullptr)},
            {"environment", environment},
            {"integrity", integrity_name(integrity)},
            {"errors", errors}
        };
        return json{{"meta", meta}, {"error", error}, {"errors", errors}};
    }

    json validation_section() const {
        json invalid_edges = json::array();
        for (const auto& edge : graph_.find_invalid_edges()) {
            invalid_edges.push_back(edge.to_json());
        }
        json malformed = json::array();
        for (const auto& m : graph_.find_malformed_predicates()) {
            malformed.push_back(m.to_json());
        }
        return json{
            {"unreachableNodes", graph_.find_unreachable_nodes()},
            {"invalidEdges", invalid_edges},
            {"validMatchSources", graph_.valid_match_sources()},
            {"malformedPredicates", malformed},
            {"unboundNodes", graph_.find_unbound_nodes()}
        };
    }

    /// Runs the source on a worker thread bounded by wiring_timeout_ms.
    /// Any failure downgrades integrity and yields the placeholder.
    json fetch_wiring_report(const std::string& company_id, const std::string& environment,
                             const std::optional<json>& company,
                             Integrity& integrity, std::vector<std::string>& errors) const {
        auto fail = [&](const std::string& reason) {
            integrity = downgrade(integrity, Integrity::Degraded);
            errors.push_back("Wiring report unavailable: " + reason);
            LOG_WARN("[Truth] Wiring report unavailable: " + reason);
            return unavailable_report(reason);
        };

        if (!source_) {
            return fail("no wiring report source configured");
        }

        WiringRequest request{company_id, environment, company};
        auto call = std::make_shared<WiringCall>();
        auto source = source_;

        std::thread worker([call, source, request]() {
            Result<json> result = make_error(ErrorType::Unknown, "wiring report source did not run");
            try {
                result = source->generate(request);
            } catch (const std::exception& e) {
                result = make_error(ErrorType::Unknown, std::string("wiring report source threw: ") + e.what());
            }
            std::lock_guard<std::mutex> lock(call->mutex);
            call->result = std::move(result);
            call->done = true;
            call->cv.notify_all();
        });

        std::unique_lock<std::mutex> lock(call->mutex);
        bool finished = call->cv.wait_for(lock, std::chrono::milliseconds(config_.wiring_timeout_ms),
                                          [&call]() { return call->done; });
        if (!finished) {
            lock.unlock();
            // Let it finish in background; it only touches the shared call state
            worker.detach();
            return fail("timed out after " + std::to_string(config_.wiring_timeout_ms) + "ms ("
                        + source->name() + ")");
        }
        Result<json> result = std::move(*call->result);
        lock.unlock();
        worker.join();

        if (result.is_error()) {
            return fail(result.error().describe());
        }
        auto shape = validate_wiring_report_shape(result.value());
        if (shape.is_error()) {
            return fail(shape.error().describe());
        }
        return result.value();
    }
};

TruthBundleExporter::TruthBundleExporter(const flow::FlowGraph& graph,
                                         std::shared_ptr<WiringReportSource> wiring_source,
                                         const TruthExportConfig& config)
    : impl_(std::make_unique<Impl>(graph, std::move(wiring_source), config)) {}

TruthBundleExporter::~TruthBundleExporter() = default;

json TruthBundleExporter::generate(const ExportOptions& options) const {
    return impl_->generate(options);
}

Result<std::string> TruthBundleExporter::compute_hash(const json& bundle) {
    json body = bundle;
    if (body.is_object()) {
        body.erase("meta");
    }
    std::string canonical;
    try {
        canonical = body.dump();
    } catch (const json::type_error& e) {
        return make_invalid_input_error(std::string("Bundle is not serializable: ") + e.what());
    }
    return sha256_hex(canonical);
}

BundleValidation TruthBundleExporter::validate(const json& bundle) {
    BundleValidation result;
    auto add = [&result](const std::string& error) {
        result.valid = false;
        result.errors.push_back(error);
    };

    if (!bundle.is_object()) {
        add("Bundle is not a JSON object");
        return result;
    }

    const bool has_meta = bundle.contains("meta") && bundle["meta"].is_object();
    if (!has_meta) {
        add("Missing meta section");
    } else {
        const json& meta = bundle["meta"];
        if (!meta.contains("schema") || meta["schema"] != kTruthBundleSchema) {
            add(std::string("Invalid schema: expected ") + kTruthBundleSchema);
        }
    }

    if (!bundle.contains("flowTree")) add("Missing flowTree");
    if (!bundle.contains("runtimeBindings")) add("Missing runtimeBindings");

    if (has_meta) {
        const json& meta = bundle["meta"];
        auto hash = compute_hash(bundle);
        if (hash.is_error()) {
            add("Could not recompute hash: " + hash.error().message);
        } else if (!meta.contains("hash") || !meta["hash"].is_string()) {
            add("Missing meta.hash");
        } else if (meta["hash"].get<std::string>() != hash.value()) {
            add("Hash mismatch: bundle content does not match meta.hash");
        }
    }

    if (bundle.contains("validation") && bundle["validation"].is_object()) {
        const json& validation = bundle["validation"];
        if (validation.contains("unreachableNodes") && validation["unreachableNodes"].is_array()
            && !validation["unreachableNodes"].empty()) {
            add("Unreachable nodes: " + join_ids(validation["unreachableNodes"]));
        }
        if (validation.contains("invalidEdges") && validation["invalidEdges"].is_array()
            && !validation["invalidEdges"].empty()) {
            add("Invalid edges: " + join_ids(validation["invalidEdges"]));
        }
    }

    return result;
}

std::optional<std::string> TruthBundleExporter::resolve_flow_node_id(const RuntimeState& state) const {
    return impl_->resolve(state);
}

PathCheck TruthBundleExporter::check_path_in_tree(const RuntimeState& state) const {
    PathCheck check;
    check.flow_node_id = impl_->resolve(state);
    check.in_tree = check.flow_node_id.has_value();
    if (!check.in_tree) {
        check.warning = json{
            {"type", "OUT_OF_TREE_PATH"},
            {"message", "Runtime path does not map to any flow tree node"},
            {"signals", state.to_json()}
        };
        LOG_WARN("[Truth] OUT_OF_TREE_PATH "
            + state.to_json().dump(-1, ' ', false, json::error_handler_t::replace));
    }
    return check;
}

} // namespace truth
} // namespace callroute
