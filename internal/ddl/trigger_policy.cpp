#include "internal/ddl/trigger_policy.hpp"

namespace doccat::ddl {

std::vector<TriggerStep> TriggerSteps() {
  struct Cell {
    bool row_exists;
    bool new_is_null;
  };
  static constexpr Cell kOrder[] = {
      {true, true},
      {true, false},
      {false, false},
      {false, true},
  };

  std::vector<TriggerStep> steps;
  for (const auto& cell : kOrder) {
    CommentAction action = Transition(cell.row_exists, cell.new_is_null);
    if (action == CommentAction::kNoop) continue;
    steps.push_back({action, cell.row_exists, cell.new_is_null});
  }
  return steps;
}

std::string_view ActionName(CommentAction action) {
  switch (action) {
    case CommentAction::kNoop:
      return "noop";
    case CommentAction::kInsert:
      return "insert";
    case CommentAction::kUpdate:
      return "update";
    case CommentAction::kDelete:
      return "delete";
  }
  return "unknown";
}

} // namespace doccat::ddl
