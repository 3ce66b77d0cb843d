/**
 * Config loading, validation and save/load.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace viva;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static fs::path scratch_dir() {
    fs::path dir = fs::temp_directory_path() / "viva_test_config";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    file << text;
}

static void test_load_partial_file() {
    fs::path dir = scratch_dir();
    write_file(dir / "config.json", R"({
        "session": {"deadline_s": 900, "interview_type": "backend_engineer"},
        "decision": {"coverage_threshold": 0.7, "max_followup_depth": 2},
        "timeouts": {"scoring_ms": 1500},
        "plan_source": {"backend": "file", "path": "plans/today.json"},
        "scorer": {"backend": "keyword"}
    })");

    Config config = Config::load_from_file((dir / "config.json").string());
    ASSERT(config.session.deadline_s == 900);
    ASSERT(config.session.interview_type == "backend_engineer");
    ASSERT(config.decision.coverage_threshold > 0.69f && config.decision.coverage_threshold < 0.71f);
    ASSERT(config.decision.max_followup_depth == 2);
    ASSERT(config.timeouts.scoring_ms == 1500);
    // Untouched sections keep their defaults
    ASSERT(config.timeouts.synthesis_ms == 10000);
    ASSERT(config.vad.end_of_turn_silence_ms == 1500);
    ASSERT(config.plan_source.path == (dir / "plans/today.json").lexically_normal().string());
    ASSERT(config.deadline() == Duration(900000));
    ASSERT(config.min_followup_cost() == Duration(60000));
    ASSERT(config.decision.min_followup_cost() == config.min_followup_cost());
    ASSERT(config.validate().is_ok());

    // A directory argument loads config.json inside it
    Config from_dir = Config::load_from_file(dir.string());
    ASSERT(from_dir.session.deadline_s == 900);
}

static void test_missing_or_broken_file() {
    fs::path dir = scratch_dir();
    Config missing = Config::load_from_file((dir / "nope.json").string());
    ASSERT(missing.session.deadline_s == 1800);
    ASSERT(missing.scorer.backend == "keyword");

    write_file(dir / "broken.json", "{ not json");
    Config broken = Config::load_from_file((dir / "broken.json").string());
    ASSERT(broken.session.deadline_s == 1800);
}

static void test_validate() {
    Config config;
    ASSERT(config.validate().is_ok());

    config.session.deadline_s = 0;
    config.decision.coverage_threshold = 1.5f;
    config.scorer.backend = "oracle";
    auto invalid = config.validate();
    ASSERT(invalid.is_error());
    ASSERT(invalid.error().type == ErrorType::InvalidState);
    ASSERT(invalid.error().message.find("deadline_s") != std::string::npos);
    ASSERT(invalid.error().message.find("coverage_threshold") != std::string::npos);
    ASSERT(invalid.error().message.find("scorer.backend") != std::string::npos);

    Config http;
    http.plan_source.backend = "http";
    ASSERT(http.validate().is_error());
    http.plan_source.endpoint = "http://localhost:8080/plan";
    ASSERT(http.validate().is_ok());

    Config defaults;
    defaults.plan_defaults.target_s = defaults.plan_defaults.max_s + 1;
    ASSERT(defaults.validate().is_error());
}

static void test_save_and_reload() {
    fs::path dir = scratch_dir();
    Config config;
    config.session.deadline_s = 1200;
    config.session.greeting = "Hi there.";
    config.decision.min_followup_cost_s = 45;
    config.recorder.persistence_url = "http://localhost:9000/records";
    config.plan_source.path = "/srv/plans/plan.json";
    config.save_to_file((dir / "saved.json").string());

    Config reloaded = Config::load_from_file((dir / "saved.json").string());
    ASSERT(reloaded.session.deadline_s == 1200);
    ASSERT(reloaded.session.greeting == "Hi there.");
    ASSERT(reloaded.min_followup_cost() == Duration(45000));
    ASSERT(reloaded.recorder.persistence_url == "http://localhost:9000/records");
    ASSERT(reloaded.plan_source.path == "/srv/plans/plan.json");
    ASSERT(reloaded.validate().is_ok());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

int main() {
    test_load_partial_file();
    test_missing_or_broken_file();
    test_validate();
    test_save_and_reload();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
