#include "session_recorder.h"
#include "logger.h"
#include <curl/curl.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace viva {

class SessionRecorder::Impl {
public:
    explicit Impl(const RecorderConfig& config) : config_(config) {
        if (!config_.persistence_url.empty()) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }
    }

    ~Impl() {
        flush();
        if (!config_.persistence_url.empty()) {
            curl_global_cleanup();
        }
    }

    /// Wait for every in-flight POST to finish (each is bounded by post_timeout_ms).
    void flush() {
        std::vector<Post> posts;
        {
            std::lock_guard<std::mutex> lock(posts_mutex_);
            posts.swap(posts_);
        }
        for (auto& post : posts) {
            if (post.worker.joinable()) post.worker.join();
        }
    }

    size_t pending_posts() const {
        std::lock_guard<std::mutex> lock(posts_mutex_);
        size_t pending = 0;
        for (const auto& post : posts_) {
            if (!*post.done) ++pending;
        }
        return pending;
    }

    void on_exchange(const SessionInfo& info, const Exchange& exchange) {
        json record = exchange_to_json(exchange);
        record["session_id"] = info.id;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (ensure_dir(info.id)) {
                std::ofstream file(session_path(info.id) + "/exchanges.jsonl", std::ios::app);
                if (file.is_open()) {
                    file << record.dump() << "\n";
                } else {
                    LOG_WARN("[Recorder] cannot append to " + session_path(info.id) + "/exchanges.jsonl");
                }
            }
        }

        notify_persistence("exchange", record);
    }

    void on_summary(const SessionSummary& summary) {
        json record = summary_to_json(summary);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (ensure_dir(summary.info.id)) {
                std::string path = session_path(summary.info.id) + "/summary.json";
                std::ofstream file(path);
                if (file.is_open()) {
                    file << record.dump(2) << "\n";
                    LOG_SESSION("summary written to " + path);
                } else {
                    LOG_WARN("[Recorder] cannot write " + path);
                }
            }
        }

        notify_persistence("summary", record);
    }

    std::string session_path(const std::string& session_id) const {
        return config_.session_log_dir + "/" + session_id;
    }

private:
    bool ensure_dir(const std::string& session_id) {
        std::error_code ec;
        std::filesystem::create_directories(session_path(session_id), ec);
        if (ec) {
            LOG_WARN("[Recorder] cannot create " + session_path(session_id) + ": " + ec.message());
            return false;
        }
        return true;
    }

    // POST on a worker thread; failures are only logged
    void notify_persistence(const std::string& record_type, const json& record) {
        if (config_.persistence_url.empty()) return;

        json envelope;
        envelope["type"] = record_type;
        envelope["record"] = record;

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread worker([url = config_.persistence_url, payload = envelope.dump(),
                            timeout_ms = config_.post_timeout_ms, done]() {
            CURL* curl = curl_easy_init();
            if (!curl) {
                *done = true;
                return;
            }

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");

            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(curl);
            if (res != CURLE_OK) {
                Logger::debug(std::string("[Recorder] POST failed: ") + curl_easy_strerror(res));
            }

            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);
            *done = true;
        });

        std::lock_guard<std::mutex> lock(posts_mutex_);
        reap_finished_locked();
        posts_.push_back(Post{std::move(worker), std::move(done)});
    }

    struct Post {
        std::thread worker;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_finished_locked() {
        for (auto it = posts_.begin(); it != posts_.end();) {
            if (*it->done) {
                it->worker.join();
                it = posts_.erase(it);
            } else {
                ++it;
            }
        }
    }

    RecorderConfig config_;
    std::mutex mutex_;
    mutable std::mutex posts_mutex_;
    std::vector<Post> posts_;
};

SessionRecorder::SessionRecorder(const RecorderConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

SessionRecorder::~SessionRecorder() = default;

void SessionRecorder::on_exchange(const SessionInfo& info, const Exchange& exchange) {
    pimpl_->on_exchange(info, exchange);
}

void SessionRecorder::on_summary(const SessionSummary& summary) {
    pimpl_->on_summary(summary);
}

void SessionRecorder::flush() {
    pimpl_->flush();
}

size_t SessionRecorder::pending_posts() const {
    return pimpl_->pending_posts();
}

std::string SessionRecorder::session_path(const std::string& session_id) const {
    return pimpl_->session_path(session_id);
}

} // namespace viva
