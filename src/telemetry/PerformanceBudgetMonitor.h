#pragma once

#include <optional>
#include <string>

#include "config/AppConfig.h"

namespace telemetry
{

// Milliseconds spent in each stage of one frame.
struct StageTimingSample
{
    double inputMs = 0.0;
    double renderMs = 0.0;
    double commandMs = 0.0;
};

struct BudgetViolation
{
    std::string stage;
    double sampleMs = 0.0;
    double budgetMs = 0.0;
};

// Compares frame stage timings against per-stage budgets.
class PerformanceBudgetMonitor
{
  public:
    PerformanceBudgetMonitor() = default;
    explicit PerformanceBudgetMonitor(const PerformanceBudgetConfig &budget) : m_budget(budget) {}

    void setBudget(const PerformanceBudgetConfig &budget) { m_budget = budget; }

    // First stage, in frame order, whose sample exceeds its budget plus the
    // tolerance. A stage with a zero budget is never reported.
    std::optional<BudgetViolation> evaluate(const StageTimingSample &sample) const;

  private:
    PerformanceBudgetConfig m_budget;
};

} // namespace telemetry
