#include "telemetry/PerformanceBudgetMonitor.h"

#include <algorithm>
#include <cmath>

namespace telemetry
{

std::optional<BudgetViolation> PerformanceBudgetMonitor::evaluate(const StageTimingSample &sample) const
{
    const double tolerance = std::max(0.0, static_cast<double>(m_budget.toleranceMs));
    const auto check = [tolerance](const char *stage, double ms, float budget) -> std::optional<BudgetViolation> {
        if (!(budget > 0.0f) || !std::isfinite(ms) || ms <= budget + tolerance)
        {
            return std::nullopt;
        }
        return BudgetViolation{stage, ms, static_cast<double>(budget)};
    };

    if (auto violation = check("input", sample.inputMs, m_budget.inputMs))
    {
        return violation;
    }
    if (auto violation = check("render", sample.renderMs, m_budget.renderMs))
    {
        return violation;
    }
    return check("commands", sample.commandMs, m_budget.commandMs);
}

} // namespace telemetry
