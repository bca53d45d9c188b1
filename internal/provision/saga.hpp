#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace proxicloud::provision {

/*
  Saga = ordered (action, compensation) steps.

  Run():
    - executes actions in order
    - on the first failing action, runs the compensations of every step that
      already succeeded, newest first, then rethrows the original error
    - a failing compensation is logged as a warning and the remaining
      compensations still run

  A step without compensation (pure computation, final commit) simply has
  nothing to undo.
*/
class Saga {
 public:
  using Action = std::function<void()>;

  explicit Saga(std::string name);

  Saga& Step(std::string name, Action action, Action compensation = {});

  void Run();

  size_t StepCount() const {
    return steps_.size();
  }

 private:
  struct StepDef {
    std::string name;
    Action      action;
    Action      compensation;
  };

  void Compensate(size_t failed_index, std::string_view reason);

  std::string          name_;
  std::vector<StepDef> steps_;
};

// Runs fn, logging (not propagating) a std::exception as a warning.
// Returns false when fn threw.
bool RunBestEffort(std::string_view what, const std::function<void()>& fn);

} // namespace proxicloud::provision
