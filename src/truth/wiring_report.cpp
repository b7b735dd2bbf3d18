#include "truth/wiring_report.h"
#include "logger.h"
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

namespace callroute {
namespace truth {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string url_escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return value;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

} // namespace

FunctionWiringReportSource::FunctionWiringReportSource(Generator generator, std::string name)
    : generator_(std::move(generator)), name_(std::move(name)) {}

Result<json> FunctionWiringReportSource::generate(const WiringRequest& request) {
    if (!generator_) {
        return make_error(ErrorType::InvalidInput, "No wiring report generator configured");
    }
    try {
        return generator_(request);
    } catch (const std::exception& e) {
        return make_error(ErrorType::Unknown, std::string("Wiring report generator threw: ") + e.what());
    }
}

HttpWiringReportSource::HttpWiringReportSource(std::string url, int timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpWiringReportSource::~HttpWiringReportSource() {
    curl_global_cleanup();
}

Result<json> HttpWiringReportSource::generate(const WiringRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }

    std::string url = url_;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += "companyId=" + url_escape(curl, request.company_id);
    url += "&environment=" + url_escape(curl, request.environment);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");

    std::string response_buffer;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 1000L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    LOG_TRUTH("Fetching wiring report from " + url_);
    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_timeout_error("Wiring report request timed out");
    }
    if (res != CURLE_OK) {
        return make_network_error(curl_easy_strerror(res));
    }
    if (status < 200 || status >= 300) {
        return make_network_error("Wiring report endpoint returned HTTP " + std::to_string(status));
    }

    try {
        return json::parse(response_buffer);
    } catch (const json::exception& e) {
        return make_parse_error("Wiring report is not valid JSON: " + std::string(e.what()));
    }
}

Result<void> validate_wiring_report_shape(const json& report) {
    if (!report.is_object()) {
        return make_invalid_input_error("Wiring report must be a JSON object");
    }
    for (const char* key : {"health", "scope", "meta"}) {
        if (report.contains(key) && !report[key].is_object()) {
            return make_invalid_input_error(std::string("Wiring report field '") + key + "' must be an object");
        }
    }
    // The report is hashed, so every string in it must serialize
    try {
        report.dump();
    } catch (const json::type_error& e) {
        return make_invalid_input_error(std::string("Wiring report is not serializable: ") + e.what());
    }
    return Result<void>();
}

} // namespace truth
} // namespace callroute
