#include "internal/provision/saga.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using proxicloud::provision::RunBestEffort;
using proxicloud::provision::Saga;

void TestAllStepsRunInOrder() {
  std::vector<std::string> log;

  Saga saga("ordered");
  saga.Step("a", [&] { log.push_back("a"); }, [&] { log.push_back("undo a"); })
      .Step("b", [&] { log.push_back("b"); })
      .Step("c", [&] { log.push_back("c"); }, [&] { log.push_back("undo c"); });

  assert(saga.StepCount() == 3);
  saga.Run();

  assert((log == std::vector<std::string>{"a", "b", "c"}));
}

void TestFailureCompensatesNewestFirstAndRethrows() {
  std::vector<std::string> log;

  Saga saga("failing");
  saga.Step("a", [&] { log.push_back("a"); }, [&] { log.push_back("undo a"); })
      .Step("b", [&] { log.push_back("b"); })
      .Step("c", [&] { log.push_back("c"); }, [&] { log.push_back("undo c"); })
      .Step("d", [&] { throw std::runtime_error("boom"); }, [&] { log.push_back("undo d"); })
      .Step("e", [&] { log.push_back("e"); }, [&] { log.push_back("undo e"); });

  bool threw = false;
  try {
    saga.Run();
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }
  assert(threw);

  // The failed step and the steps after it are never compensated.
  assert((log == std::vector<std::string>{"a", "b", "c", "undo c", "undo a"}));
}

void TestFailingCompensationDoesNotStopTheRest() {
  std::vector<std::string> log;

  Saga saga("stubborn");
  saga.Step("a", [] {}, [&] { log.push_back("undo a"); })
      .Step("b", [] {}, [&] { throw std::runtime_error("undo b failed"); })
      .Step("c", [] { throw std::logic_error("original"); });

  bool threw = false;
  try {
    saga.Run();
  } catch (const std::logic_error& e) {
    threw = std::string(e.what()) == "original";
  }
  assert(threw);
  assert((log == std::vector<std::string>{"undo a"}));
}

void TestFirstStepFailureHasNothingToUndo() {
  bool undone = false;

  Saga saga("first");
  saga.Step("a", [] { throw std::runtime_error("nope"); }, [&] { undone = true; });

  bool threw = false;
  try {
    saga.Run();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!undone);
}

void TestRunBestEffort() {
  bool ran = false;
  assert(RunBestEffort("ok", [&] { ran = true; }));
  assert(ran);

  assert(!RunBestEffort("fails", [] { throw std::runtime_error("ignored"); }));
}

} // namespace

int main() {
  TestAllStepsRunInOrder();
  TestFailureCompensatesNewestFirstAndRethrows();
  TestFailingCompensationDoesNotStopTheRest();
  TestFirstStepFailureHasNothingToUndo();
  TestRunBestEffort();

  std::cout << "proxicloud_unit_saga: pass\n";
  return 0;
}
