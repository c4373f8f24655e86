#include "internal/ddl/trigger_policy.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string_view>

using namespace doccat::ddl;

namespace {

void TestTransitionTable() {
  assert(Transition(false, true) == CommentAction::kNoop);
  assert(Transition(false, false) == CommentAction::kInsert);
  assert(Transition(true, true) == CommentAction::kDelete);
  assert(Transition(true, false) == CommentAction::kUpdate);
}

void TestEmptyCommentCountsAsAbsent() {
  assert(IsAbsent(std::nullopt));
  assert(IsAbsent(std::optional<std::string_view>("")));
  assert(!IsAbsent(std::optional<std::string_view>(" ")));
  assert(!IsAbsent(std::optional<std::string_view>("documented")));
}

void TestStepsRunDeleteUpdateInsert() {
  auto steps = TriggerSteps();
  assert(steps.size() == 3);

  assert(steps[0].action == CommentAction::kDelete);
  assert(steps[0].row_exists && steps[0].new_is_null);

  assert(steps[1].action == CommentAction::kUpdate);
  assert(steps[1].row_exists && !steps[1].new_is_null);

  assert(steps[2].action == CommentAction::kInsert);
  assert(!steps[2].row_exists && !steps[2].new_is_null);

  for (const auto& step : steps) {
    assert(Transition(step.row_exists, step.new_is_null) == step.action);
  }
}

void TestActionNames() {
  assert(ActionName(CommentAction::kNoop) == "noop");
  assert(ActionName(CommentAction::kDelete) == "delete");
}

} // namespace

int main() {
  TestTransitionTable();
  TestEmptyCommentCountsAsAbsent();
  TestStepsRunDeleteUpdateInsert();
  TestActionNames();

  std::cout << "doccat_unit_trigger_policy: pass\n";
  return 0;
}
