#include "internal/catalog/object_kind.hpp"
#include "internal/store/extended_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/catalog_fixture.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>

using namespace doccat;
using ddl::CommentAction;

namespace {

factory::Application InstalledApplication() {
  auto app = testing::MakeApplication();
  (void)app.deployment->Setup();
  return app;
}

CommentAction Apply(store::ExtendedStore& store, const store::KeyValues& key, const std::optional<std::string>& text) {
  auto          tx      = store.Begin();
  CommentAction applied = CommentAction::kNoop;
  auto          result  = store.ApplyComment(*tx, "TABLES", key, text, applied);
  assert(result);
  tx->Commit();
  return applied;
}

void TestCreateTablePlanExecutes() {
  auto app = testing::MakeApplication();

  for (const auto& stmt : app.store->PlanCreateTables()) {
    app.db->Exec(ddl::ToSql(stmt));
  }
  for (const auto& kind : catalog::AllKinds()) {
    assert(app.store->HasTable(kind.table));
  }
}

void TestEveryTransitionCell() {
  auto  app   = InstalledApplication();
  auto& store = *app.store;
  store::KeyValues key{"APP", "ORDERS"};

  // no row, absent comment
  assert(Apply(store, key, std::nullopt) == CommentAction::kNoop);
  assert(Apply(store, key, std::string()) == CommentAction::kNoop);

  // no row, comment
  assert(Apply(store, key, std::string("Orders placed by customers")) == CommentAction::kInsert);

  // row, comment
  assert(Apply(store, key, std::string("Orders, one per checkout")) == CommentAction::kUpdate);

  {
    auto tx = store.Begin();
    assert(store.GetComment(*tx, "TABLES", key) == std::optional<std::string>("Orders, one per checkout"));
    assert(store.CountRows(*tx, "TABLES") == 1);
  }

  // row, empty comment removes it
  assert(Apply(store, key, std::string()) == CommentAction::kDelete);

  auto tx = store.Begin();
  assert(!store.GetComment(*tx, "TABLES", key).has_value());
  assert(store.CountRows(*tx, "TABLES") == 0);
}

void TestLongCommentsAreKept() {
  auto  app   = InstalledApplication();
  auto& store = *app.store;

  std::string text(5000, 'x');
  assert(Apply(store, {"APP", "ORDERS"}, text) == CommentAction::kInsert);

  auto tx = store.Begin();
  assert(store.GetComment(*tx, "TABLES", {"APP", "ORDERS"}) == std::optional<std::string>(text));
}

void TestWrongKeyArityIsRejected() {
  auto  app   = InstalledApplication();
  auto& store = *app.store;

  auto          tx      = store.Begin();
  CommentAction applied = CommentAction::kNoop;
  bool          threw   = false;
  try {
    (void)store.ApplyComment(*tx, "TABLES", {"APP"}, std::string("x"), applied);
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingTableIsNotFound() {
  auto app = testing::MakeApplication();

  auto          tx      = app.store->Begin();
  CommentAction applied = CommentAction::kNoop;
  auto          result  = app.store->ApplyComment(*tx, "TABLES", {"APP", "ORDERS"}, std::string("x"), applied);
  assert(!result);
  assert(result.code == db::ErrorCode::NotFound);
}

void TestCopyRoutineComments() {
  auto  app   = InstalledApplication();
  auto& store = *app.store;

  {
    auto          tx      = store.Begin();
    CommentAction applied = CommentAction::kNoop;
    assert(store.ApplyComment(*tx, "ROUTINES", {"APP", "PURGE_V1"}, std::string("Purges old orders"), applied));
    assert(store.ApplyComment(*tx, "ROUTINEPARMS", {"APP", "PURGE_V1", "P", "1"}, std::string("Days to keep"),
                              applied));
    assert(store.ApplyComment(*tx, "ROUTINEPARMS", {"APP", "PURGE_V2", "P", "9"}, std::string("stale"), applied));
    tx->Commit();
  }

  auto tx = store.Begin();
  assert(store.CopyRoutineComments(*tx, "APP", "PURGE_V1", "PURGE_V2"));
  assert(store.CopyRoutineParameterComments(*tx, "APP", "PURGE_V1", "PURGE_V2"));
  tx->Commit();

  auto check = store.Begin();
  assert(store.GetComment(*check, "ROUTINES", {"APP", "PURGE_V2"}) ==
         std::optional<std::string>("Purges old orders"));
  assert(store.GetComment(*check, "ROUTINEPARMS", {"APP", "PURGE_V2", "P", "1"}) ==
         std::optional<std::string>("Days to keep"));
  // the target's previous parameter comments are replaced
  assert(!store.GetComment(*check, "ROUTINEPARMS", {"APP", "PURGE_V2", "P", "9"}).has_value());
  // the source is untouched
  assert(store.GetComment(*check, "ROUTINES", {"APP", "PURGE_V1"}) ==
         std::optional<std::string>("Purges old orders"));
}

} // namespace

int main() {
  TestCreateTablePlanExecutes();
  TestEveryTransitionCell();
  TestLongCommentsAreKept();
  TestWrongKeyArityIsRejected();
  TestMissingTableIsNotFound();
  TestCopyRoutineComments();

  std::cout << "doccat_unit_extended_store: pass\n";
  return 0;
}
