#include "ct_base.hpp"
#include "trace/step_reporter.hpp"

#include <mutex>

namespace calltrace::trace
{

namespace
{
std::mutex g_reporter_mu;

std::shared_ptr<StepReporter> &reporter_slot()
{
    static std::shared_ptr<StepReporter> slot = std::make_shared<NullStepReporter>();
    return slot;
}
} // namespace

void install_step_reporter(std::shared_ptr<StepReporter> reporter)
{
    if (!reporter)
        reporter = std::make_shared<NullStepReporter>();
    std::lock_guard<std::mutex> lock(g_reporter_mu);
    reporter_slot() = std::move(reporter);
}

std::shared_ptr<StepReporter> current_step_reporter()
{
    std::lock_guard<std::mutex> lock(g_reporter_mu);
    return reporter_slot();
}

} // namespace calltrace::trace
