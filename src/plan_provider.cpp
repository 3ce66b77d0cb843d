#include "plan_provider.h"
#include "logger.h"
#include <curl/curl.h>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace viva {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

JsonFilePlanProvider::JsonFilePlanProvider(const std::string& path, const PlanDefaultsConfig& defaults)
    : path_(path), defaults_(defaults) {}

Result<QuestionPlan> JsonFilePlanProvider::fetch(const std::string&, const std::string&) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return make_io_error("cannot open plan file: " + path_);
    }
    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        return make_parse_error("plan file " + path_ + ": " + e.what());
    }
    LOG_PLAN("Loaded plan from " + path_);
    return plan_from_json(j, defaults_);
}

HttpPlanProvider::HttpPlanProvider(const PlanSourceConfig& source, const PlanDefaultsConfig& defaults,
                                   const std::string& interview_type)
    : source_(source), defaults_(defaults), interview_type_(interview_type) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpPlanProvider::~HttpPlanProvider() {
    curl_global_cleanup();
}

Result<QuestionPlan> HttpPlanProvider::fetch(const std::string& candidate_id, const std::string& job_id) {
    if (source_.endpoint.empty()) {
        return make_network_error("plan_source.endpoint is not set");
    }

    json request;
    request["candidate_id"] = candidate_id;
    request["job_id"] = job_id;
    request["interview_type"] = interview_type_;
    std::string body = request.dump();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string response_buffer;
    curl_easy_setopt(curl, CURLOPT_URL, source_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(source_.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 1000L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    LOG_PLAN("Requesting plan from " + source_.endpoint);
    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return make_network_error(curl_easy_strerror(res));
    }
    if (status < 200 || status >= 300) {
        return make_network_error("plan service returned HTTP " + std::to_string(status));
    }

    try {
        return plan_from_json(json::parse(response_buffer), defaults_);
    } catch (const json::exception& e) {
        return make_parse_error("plan service reply: " + std::string(e.what()));
    }
}

std::unique_ptr<IPlanProvider> create_plan_provider(const Config& config) {
    if (config.plan_source.backend == "http") {
        return std::make_unique<HttpPlanProvider>(config.plan_source, config.plan_defaults,
                                                  config.session.interview_type);
    }
    return std::make_unique<JsonFilePlanProvider>(config.plan_source.path, config.plan_defaults);
}

} // namespace viva
