#include "scoring/http_answer_scorer.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <algorithm>
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace viva {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return token->is_cancelled() ? 1 : 0;
}

std::string strip_code_fence(const std::string& content) {
    std::string s = utils::trim_copy(content);
    if (s.rfind("```", 0) != 0) return s;
    size_t first_newline = s.find('\n');
    if (first_newline == std::string::npos) return s;
    size_t closing = s.rfind("```");
    if (closing == std::string::npos || closing <= first_newline) return s;
    return utils::trim_copy(s.substr(first_newline + 1, closing - first_newline - 1));
}

} // namespace

class HttpAnswerScorer::Impl {
public:
    Impl(const ScorerConfig& config, int timeout_ms) : config_(config), timeout_ms_(timeout_ms) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        if (!config_.api_key_env.empty()) {
            const char* key = std::getenv(config_.api_key_env.c_str());
            if (key) api_key_ = key;
        }
        if (api_key_.empty()) {
            LOG_WARN("[Scorer] No API key in $" + config_.api_key_env + ", sending unauthenticated requests");
        }
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<Score> score(const ScoreRequest& request, const CancellationToken& cancel) {
        std::string body = build_request(request).dump();

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_scoring_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        if (!api_key_.empty()) {
            std::string auth = "Authorization: Bearer " + api_key_;
            headers = curl_slist_append(headers, auth.c_str());
        }

        std::string response_buffer;
        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 1000L);
        if (timeout_ms_ > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
        }
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        LOG_SCORER("POST " + config_.endpoint + " for " + request.item_id);
        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_ABORTED_BY_CALLBACK) {
            return make_cancelled_error("scoring request cancelled");
        }
        if (res != CURLE_OK) {
            return make_network_error(curl_easy_strerror(res));
        }
        if (status < 200 || status >= 300) {
            LOG_DEBUG("Scorer response body: " + response_buffer);
            return make_scoring_error("HTTP " + std::to_string(status));
        }

        try {
            json response_json = json::parse(response_buffer);
            if (!response_json.contains("choices") || !response_json["choices"].is_array() ||
                response_json["choices"].empty()) {
                return make_scoring_error("No choices in response");
            }
            const auto& message = response_json["choices"][0]["message"];
            if (!message.contains("content") || !message["content"].is_string()) {
                return make_scoring_error("No content in response");
            }
            return parse_reply(message["content"].get<std::string>());
        } catch (const json::exception& e) {
            LOG_DEBUG("Scorer response body: " + response_buffer);
            return make_parse_error("JSON parse error: " + std::string(e.what()));
        }
    }

private:
    json build_request(const ScoreRequest& request) const {
        std::string user = "Question type: " + std::string(question_type_name(request.type)) + "\n" +
                           "Question: " + request.question + "\n";
        if (!request.rubric.keywords.empty()) {
            user += "Expected points:";
            for (const auto& kw : request.rubric.keywords) user += " - " + kw;
            user += "\n";
        }
        if (!request.rubric.reference.empty()) {
            user += "Reference answer: " + request.rubric.reference + "\n";
        }
        user += "Follow-ups already asked: " + std::to_string(request.followups_issued) + "\n";
        user += "Candidate answer: " + request.answer;

        json messages = json::array();
        messages.push_back({{"role", "system"}, {"content", config_.system_prompt}});
        messages.push_back({{"role", "user"}, {"content", user}});

        json j;
        j["model"] = config_.model;
        j["messages"] = messages;
        j["temperature"] = config_.temperature;
        j["max_tokens"] = config_.max_tokens;
        j["stream"] = false;
        return j;
    }

    ScorerConfig config_;
    int timeout_ms_;
    std::string api_key_;
};

HttpAnswerScorer::HttpAnswerScorer(const ScorerConfig& config, int timeout_ms)
    : pimpl_(std::make_unique<Impl>(config, timeout_ms)) {}

HttpAnswerScorer::~HttpAnswerScorer() = default;

Result<Score> HttpAnswerScorer::score(const ScoreRequest& request, const CancellationToken& cancel) {
    return pimpl_->score(request, cancel);
}

Result<Score> HttpAnswerScorer::parse_reply(const std::string& content) {
    try {
        json reply = json::parse(strip_code_fence(content));
        if (!reply.is_object() || !reply.contains("coverage") || !reply["coverage"].is_number()) {
            return make_scoring_error("Reply has no numeric coverage: " + content);
        }
        Score score;
        score.coverage = std::max(0.0f, std::min(1.0f, reply["coverage"].get<float>()));
        if (reply.contains("follow_up") && reply["follow_up"].is_string()) {
            score.follow_up = utils::trim_copy(reply["follow_up"].get<std::string>());
        }
        return score;
    } catch (const json::exception& e) {
        return make_parse_error("Reply is not JSON: " + std::string(e.what()));
    }
}

} // namespace viva
