#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace doccat::ddl {

enum class CommentAction : std::uint8_t {
  kNoop   = 0,
  kInsert = 1,
  kUpdate = 2,
  kDelete = 3,
};

// An empty comment counts as no comment.
constexpr bool IsAbsent(const std::optional<std::string_view>& comment) {
  return !comment.has_value() || comment->empty();
}

/*
  What a comment write does to the extended store.

                      new absent   new present
    no stored row     noop         insert
    stored row        delete       update
*/
constexpr CommentAction Transition(bool row_exists, bool new_is_null) {
  if (!row_exists) {
    return new_is_null ? CommentAction::kNoop : CommentAction::kInsert;
  }
  return new_is_null ? CommentAction::kDelete : CommentAction::kUpdate;
}

static_assert(Transition(false, false) == CommentAction::kInsert);
static_assert(Transition(false, true) == CommentAction::kNoop);
static_assert(Transition(true, true) == CommentAction::kDelete);
static_assert(Transition(true, false) == CommentAction::kUpdate);

struct TriggerStep {
  CommentAction action;

  // cell of the transition table guarding this step
  bool row_exists;
  bool new_is_null;
};

/*
  Non-noop cells in the order a trigger body runs them. Every step is
  guarded by its own cell, and a step only ever creates or removes a row
  after the steps that test for it have run, so exactly one fires per row.
*/
std::vector<TriggerStep> TriggerSteps();

std::string_view ActionName(CommentAction action);

} // namespace doccat::ddl
