#include "internal/core/routines.hpp"

namespace doccat::core {

const std::vector<GeneratedRoutine>& GeneratedRoutines() {
  static const std::vector<GeneratedRoutine> routines = {
      {"INSTALL", {}},
      {std::string(kUninstallRoutine), {}},
      {"INSTALL_VIEW", {"ATABLE"}},
      {"INSTALL_TRIGGER", {"ATABLE"}},
      {"TO_SYSCAT", {}},
      {"FROM_SYSCAT", {}},
      {"COPY_ROUTINE", {"OLD_SCHEMA", "OLD_SPECIFICNAME", "NEW_SPECIFICNAME"}},
      {"COPY_ROUTINEPARMS", {"OLD_SCHEMA", "OLD_SPECIFICNAME", "NEW_SPECIFICNAME"}},
  };
  return routines;
}

std::vector<ddl::Statement> PlanCreateRoutines(const std::string& ns) {
  std::vector<ddl::Statement> plan;
  for (const auto& routine : GeneratedRoutines()) {
    ddl::CreateRoutine stmt;
    stmt.routine    = {ns, routine.specific_name};
    stmt.parameters = routine.parameters;
    plan.emplace_back(std::move(stmt));
  }
  return plan;
}

} // namespace doccat::core
