#include "saga.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace proxicloud::provision {

using proxicloud::observability::Metrics;
using proxicloud::observability::StringField;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Saga::Saga(std::string name) : name_(std::move(name)) {
}

Saga& Saga::Step(std::string name, Action action, Action compensation) {
  steps_.push_back(StepDef{std::move(name), std::move(action), std::move(compensation)});
  return *this;
}

void Saga::Run() {
  for (size_t i = 0; i < steps_.size(); ++i) {
    const auto& step  = steps_[i];
    const auto  start = std::chrono::steady_clock::now();

    try {
      step.action();
    } catch (const std::exception& e) {
      Metrics::Instance().ObserveProvisioningStepMs(step.name, false, ElapsedMs(start));
      PROXICLOUD_LOG_ERROR("Saga step failed", {StringField("saga", name_), StringField("step", step.name), StringField("error", e.what())});
      Compensate(i, e.what());
      throw;
    }

    Metrics::Instance().ObserveProvisioningStepMs(step.name, true, ElapsedMs(start));
    PROXICLOUD_LOG_DEBUG("Saga step done", {StringField("saga", name_), StringField("step", step.name)});
  }
}

void Saga::Compensate(size_t failed_index, std::string_view reason) {
  for (size_t i = failed_index; i-- > 0;) {
    const auto& step = steps_[i];
    if (!step.compensation) {
      continue;
    }

    PROXICLOUD_LOG_INFO("Compensating saga step", {StringField("saga", name_), StringField("step", step.name), StringField("reason", reason)});
    RunBestEffort("compensate " + step.name, step.compensation);
  }
}

bool RunBestEffort(std::string_view what, const std::function<void()>& fn) {
  try {
    fn();
    return true;
  } catch (const std::exception& e) {
    PROXICLOUD_LOG_WARN("Best-effort step failed", {StringField("step", what), StringField("error", e.what())});
    return false;
  }
}

} // namespace proxicloud::provision
