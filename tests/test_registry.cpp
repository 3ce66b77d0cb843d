/**
 * Session registry bookkeeping and the on-disk session recorder.
 *
 * Run from build dir: ./test_registry
 */

#include "fakes.h"
#include "interview_session.h"
#include "scoring/keyword_scorer.h"
#include "session_recorder.h"
#include "session_registry.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

using namespace viva;
using namespace viva::testing;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

/// Shared clock, timers and sink for every session in one test.
struct Env {
    Env() : timers(clock, Duration(5)) { timers.start(); }
    ~Env() { timers.stop(); }

    std::shared_ptr<InterviewSession> session(const std::string& id, std::shared_ptr<FakeChannel> channel,
                                              std::vector<ScriptedTurn> script, ISessionSink* to = nullptr) {
        Config config;
        config.timeouts.transcription_ms = 0;
        SessionDependencies deps;
        deps.clock = &clock;
        deps.timers = &timers;
        deps.speech = std::make_shared<SpeechIOAdapter>(std::make_shared<FakeSynthesizer>(),
                                                        std::make_shared<FakeTranscriber>(&clock, std::move(script)),
                                                        config.timeouts);
        deps.channel = std::move(channel);
        deps.scorer = std::make_shared<KeywordScorer>();
        deps.sink = to ? to : &sink;

        SessionInfo info;
        info.id = id;
        info.candidate_id = "c42";
        return std::make_shared<InterviewSession>(info, config, deps);
    }

    ManualClock clock;
    TimerService timers;
    RecordingSink sink;
};

static QuestionPlan one_item() {
    return QuestionPlan({make_item("q1", 60, 120, 720, 1.0, {"cache"})});
}

static void test_add_find_remove() {
    Env env;
    SessionRegistry registry;
    auto a = env.session("a", std::make_shared<FakeChannel>(), {});
    auto b = env.session("b", std::make_shared<FakeChannel>(), {});

    ASSERT(registry.add(a).is_ok());
    ASSERT(registry.add(b).is_ok());
    auto duplicate = registry.add(env.session("a", std::make_shared<FakeChannel>(), {}));
    ASSERT(duplicate.is_error());
    ASSERT(duplicate.error().type == ErrorType::InvalidState);
    ASSERT(registry.add(nullptr).is_error());

    ASSERT(registry.size() == 2);
    ASSERT(registry.find("a") == a);
    ASSERT(registry.find("zzz") == nullptr);
    auto ids = registry.ids();
    ASSERT(ids.size() == 2 && ids[0] == "a" && ids[1] == "b");

    ASSERT(registry.remove("a"));
    ASSERT(!registry.remove("a"));
    ASSERT(registry.size() == 1);
}

static void test_remove_finished() {
    Env env;
    SessionRegistry registry;

    auto gone_channel = std::make_shared<FakeChannel>();
    gone_channel->close();
    auto gone = env.session("gone", gone_channel, {});
    auto waiting = env.session("waiting", std::make_shared<FakeChannel>(), {});
    registry.add(gone);
    registry.add(waiting);

    ASSERT(gone->run(one_item()).is_ok());
    ASSERT(gone->phase() == Phase::Aborted);

    ASSERT(registry.remove_finished() == 1);
    ASSERT(registry.size() == 1);
    ASSERT(registry.find("waiting") == waiting);
}

static void test_abort_all() {
    Env env;
    SessionRegistry registry;
    auto first = env.session("first", std::make_shared<FakeChannel>(), {ScriptedTurn::hangs()});
    auto second = env.session("second", std::make_shared<FakeChannel>(), {ScriptedTurn::hangs()});
    registry.add(first);
    registry.add(second);

    ASSERT(first->start(one_item()).is_ok());
    ASSERT(second->start(one_item()).is_ok());
    ASSERT(eventually([&]() {
        return first->phase() == Phase::Listening && second->phase() == Phase::Listening;
    }));

    registry.abort_all(AbortReason::Shutdown, "test");
    first->join();
    second->join();
    ASSERT(first->phase() == Phase::Aborted);
    ASSERT(second->phase() == Phase::Aborted);
    ASSERT(first->summary()->abort_reason == AbortReason::Shutdown);
    ASSERT(first->summary()->abort_detail == "test");
    ASSERT(env.sink.summaries().size() == 2);
    ASSERT(registry.remove_finished() == 2);
    ASSERT(registry.size() == 0);
}

static void test_generated_ids_do_not_collide() {
    Env env;
    SessionRegistry registry;
    std::string first = generate_session_id("c42");
    std::string second = generate_session_id("c42");
    std::string anonymous_a = generate_session_id("");
    std::string anonymous_b = generate_session_id("");

    ASSERT(first != second);
    ASSERT(anonymous_a != anonymous_b);
    ASSERT(first.find("_c42_") == 15);
    ASSERT(anonymous_a.find("_c42") == std::string::npos);

    for (const auto& id : {first, second, anonymous_a, anonymous_b}) {
        ASSERT(registry.add(env.session(id, std::make_shared<FakeChannel>(), {})).is_ok());
    }
    ASSERT(registry.size() == 4);
}

static nlohmann::json read_json(const fs::path& path) {
    std::ifstream file(path);
    return nlohmann::json::parse(file);
}

static void test_recorder_writes_session_files() {
    fs::path dir = fs::temp_directory_path() / "viva_test_recorder";
    std::error_code ec;
    fs::remove_all(dir, ec);

    RecorderConfig config;
    config.session_log_dir = dir.string();
    SessionRecorder recorder(config);
    ASSERT(recorder.session_path("s1") == dir.string() + "/s1");

    {
        Env env;
        auto session = env.session("s1", std::make_shared<FakeChannel>(),
                                   {ScriptedTurn::answer("Put a cache in front.", minutes(2))}, &recorder);
        ASSERT(session->run(one_item()).is_ok());
        ASSERT(session->phase() == Phase::Completed);
    }

    fs::path exchanges = dir / "s1" / "exchanges.jsonl";
    ASSERT(fs::exists(exchanges));
    std::ifstream lines(exchanges);
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        if (line.empty()) continue;
        auto record = nlohmann::json::parse(line);
        ASSERT(record["session_id"] == "s1");
        ASSERT(record["item_id"] == "q1");
        ASSERT(record["decision"] == "advance");
        ++count;
    }
    ASSERT(count == 1);

    fs::path summary_path = dir / "s1" / "summary.json";
    ASSERT(fs::exists(summary_path));
    auto summary = read_json(summary_path);
    ASSERT(summary["session_id"] == "s1");
    ASSERT(summary["final_phase"] == "completed");
    ASSERT(summary["history"].size() == 1);
    ASSERT(summary["items"].size() == 1);
    ASSERT(summary["deadline_reached"] == false);

    fs::remove_all(dir, ec);
}

/// Accepts one HTTP request on loopback, answers 200 after a short delay and keeps the request.
class LoopbackReceiver {
public:
    LoopbackReceiver() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), len) != 0 || ::listen(fd_, 4) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            return;
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackReceiver() {
        if (thread_.joinable()) thread_.join();
        if (fd_ >= 0) ::close(fd_);
    }

    int port() const { return port_; }

    std::string request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_;
    }

private:
    void serve() {
        pollfd pfd{fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 3000) <= 0) return;
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) return;

        timeval tv{2, 0};
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string data;
        bool continued = false;
        char buf[4096];
        while (true) {
            size_t header_end = data.find("\r\n\r\n");
            if (header_end != std::string::npos) {
                std::string headers = data.substr(0, header_end);
                std::transform(headers.begin(), headers.end(), headers.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (!continued && headers.find("expect: 100-continue") != std::string::npos) {
                    const char* go = "HTTP/1.1 100 Continue\r\n\r\n";
                    ::send(client, go, std::strlen(go), MSG_NOSIGNAL);
                    continued = true;
                }
                size_t pos = headers.find("content-length:");
                size_t length = pos == std::string::npos ? 0 : std::stoul(headers.substr(pos + 15));
                if (data.size() >= header_end + 4 + length) break;
            }
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            data.append(buf, static_cast<size_t>(n));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_ = data;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        const char* ok = "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        ::send(client, ok, std::strlen(ok), MSG_NOSIGNAL);
        ::close(client);
    }

    int fd_ = -1;
    int port_ = 0;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::string request_;
};

static void test_recorder_delivers_summary_before_teardown() {
    fs::path dir = fs::temp_directory_path() / "viva_test_recorder_post";
    std::error_code ec;
    fs::remove_all(dir, ec);

    LoopbackReceiver receiver;
    ASSERT(receiver.port() > 0);

    {
        RecorderConfig config;
        config.session_log_dir = dir.string();
        config.persistence_url = "http://127.0.0.1:" + std::to_string(receiver.port()) + "/records";
        config.post_timeout_ms = 2000;
        SessionRecorder recorder(config);

        SessionSummary summary;
        summary.info.id = "s2";
        summary.final_phase = Phase::Completed;
        recorder.on_summary(summary);
        // Destroyed straight away, as at process exit
    }

    std::string request = receiver.request();
    ASSERT(request.find("POST /records") == 0);
    ASSERT(request.find("\"type\":\"summary\"") != std::string::npos);
    ASSERT(request.find("\"session_id\":\"s2\"") != std::string::npos);
    ASSERT(fs::exists(dir / "s2" / "summary.json"));

    fs::remove_all(dir, ec);
}

int main() {
    test_add_find_remove();
    test_remove_finished();
    test_abort_all();
    test_generated_ids_do_not_collide();
    test_recorder_writes_session_files();
    test_recorder_delivers_summary_before_teardown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All registry tests passed.\n";
    return 0;
}
