#pragma once

#include "config.h"
#include "errors.h"
#include "question_plan.h"
#include <memory>
#include <string>

namespace viva {

/**
 * @brief Source of the initial question plan (JD/CV matching subsystem)
 */
class IPlanProvider {
public:
    virtual ~IPlanProvider() = default;

    virtual Result<QuestionPlan> fetch(const std::string& candidate_id,
                                       const std::string& job_id) = 0;
};

/// Reads a plan from a JSON file; ids are ignored.
class JsonFilePlanProvider : public IPlanProvider {
public:
    JsonFilePlanProvider(const std::string& path, const PlanDefaultsConfig& defaults);

    Result<QuestionPlan> fetch(const std::string& candidate_id, const std::string& job_id) override;

private:
    std::string path_;
    PlanDefaultsConfig defaults_;
};

/**
 * @brief POSTs {"candidate_id", "job_id", "interview_type"} and parses the plan reply
 */
class HttpPlanProvider : public IPlanProvider {
public:
    HttpPlanProvider(const PlanSourceConfig& source, const PlanDefaultsConfig& defaults,
                     const std::string& interview_type);
    ~HttpPlanProvider();

    HttpPlanProvider(const HttpPlanProvider&) = delete;
    HttpPlanProvider& operator=(const HttpPlanProvider&) = delete;

    Result<QuestionPlan> fetch(const std::string& candidate_id, const std::string& job_id) override;

private:
    PlanSourceConfig source_;
    PlanDefaultsConfig defaults_;
    std::string interview_type_;
};

/// Provider selected by plan_source.backend.
std::unique_ptr<IPlanProvider> create_plan_provider(const Config& config);

} // namespace viva
