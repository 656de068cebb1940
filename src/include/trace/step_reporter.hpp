#pragma once
/**
 * @file step_reporter.hpp
 * @brief Optional hook that reports every traced call as a named, parameterised step.
 *
 * Install a reporter once at startup. The default NullStepReporter is disabled,
 * so the tracer then opens no step at all.
 */
#include "ct_base.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace calltrace::trace
{

/// Parameter name and rendered value, in declaration order.
using StepParams = std::vector<std::pair<std::string, std::string>>;

/** @brief An open step. Destroying it closes the step. */
class StepContext
{
  public:
    virtual ~StepContext() = default;
};

class StepReporter
{
  public:
    virtual ~StepReporter() = default;

    [[nodiscard]] virtual bool enabled() const noexcept { return true; }

    /** @brief Opens a step. May return nullptr when nothing needs closing. */
    virtual std::unique_ptr<StepContext> open_step(const std::string &title,
                                                   const StepParams &params) = 0;
};

class NullStepReporter final : public StepReporter
{
  public:
    [[nodiscard]] bool enabled() const noexcept override { return false; }
    std::unique_ptr<StepContext> open_step(const std::string &, const StepParams &) override
    {
        return nullptr;
    }
};

/** @brief Selects the process-wide reporter; nullptr restores the NullStepReporter. */
CALLTRACE_EXPORT void install_step_reporter(std::shared_ptr<StepReporter> reporter);

/** @brief The process-wide reporter; never null. */
CALLTRACE_EXPORT std::shared_ptr<StepReporter> current_step_reporter();

} // namespace calltrace::trace
