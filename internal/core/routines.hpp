#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/ddl/statement.hpp"

namespace doccat::core {

// dropped last, by Remove(); uninstall keeps it so it can be called again
inline constexpr std::string_view kUninstallRoutine = "UNINSTALL";

struct GeneratedRoutine {
  std::string              specific_name;
  std::vector<std::string> parameters;
};

/*
  Procedures published in the merged namespace. Their bodies are the
  doccat operations of the same name (see doccatctl).
*/
const std::vector<GeneratedRoutine>& GeneratedRoutines();

std::vector<ddl::Statement> PlanCreateRoutines(const std::string& ns);

} // namespace doccat::core
