#pragma once

#include "errors.h"
#include <string>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace callroute {
namespace truth {

struct WiringRequest {
    std::string company_id;
    std::string environment;
    std::optional<nlohmann::json> company;
};

/**
 * @brief Producer of the wiring report embedded in a Truth Bundle
 *
 * May be slow or fail. The exporter calls it on a worker thread with a
 * timeout, so implementations need not bound themselves.
 */
class WiringReportSource {
public:
    virtual ~WiringReportSource() = default;

    virtual Result<nlohmann::json> generate(const WiringRequest& request) = 0;

    /// Short name for log lines
    virtual std::string name() const = 0;
};

/// Wraps an in-process generator. Exceptions it throws become errors.
class FunctionWiringReportSource : public WiringReportSource {
public:
    using Generator = std::function<nlohmann::json(const WiringRequest&)>;

    explicit FunctionWiringReportSource(Generator generator, std::string name = "function");

    Result<nlohmann::json> generate(const WiringRequest& request) override;
    std::string name() const override { return name_; }

private:
    Generator generator_;
    std::string name_;
};

/**
 * @brief GET <url>?companyId=...&environment=... and parse the JSON body
 *
 * Non-2xx responses, transport errors and unparseable bodies are errors.
 */
class HttpWiringReportSource : public WiringReportSource {
public:
    HttpWiringReportSource(std::string url, int timeout_ms);
    ~HttpWiringReportSource() override;

    Result<nlohmann::json> generate(const WiringRequest& request) override;
    std::string name() const override { return "http"; }

private:
    std::string url_;
    int timeout_ms_;
};

/**
 * @brief Structural check of a generated report
 *
 * Must be a JSON object; `health`, `scope` and `meta`, when present, must
 * be objects.
 */
Result<void> validate_wiring_report_shape(const nlohmann::json& report);

} // namespace truth
} // namespace callroute
