#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using doccat::factory::Application;

static void Usage() {
  std::cout << "Usage:\n"
            << "  doccatctl --config <config.yaml> setup\n"
            << "  doccatctl --config <config.yaml> remove\n"
            << "  doccatctl --config <config.yaml> install\n"
            << "  doccatctl --config <config.yaml> uninstall\n"
            << "  doccatctl --config <config.yaml> plan-install\n"
            << "  doccatctl --config <config.yaml> plan-uninstall\n"
            << "  doccatctl --config <config.yaml> export\n"
            << "  doccatctl --config <config.yaml> to-native\n"
            << "  doccatctl --config <config.yaml> from-native\n"
            << "  doccatctl --config <config.yaml> copy-routine <schema> <old_specific> <new_specific>\n";
}

static bool KnownCommand(const std::string& cmd, std::size_t arg_count) {
  if (cmd == "copy-routine") return arg_count == 3;
  static const std::vector<std::string> kCommands = {"setup",  "remove",    "install",     "uninstall", "plan-install",
                                                     "plan-uninstall", "export", "to-native", "from-native"};
  for (const auto& known : kCommands) {
    if (cmd == known) return arg_count == 0;
  }
  return false;
}

static void PrintPlan(const std::vector<doccat::ddl::Statement>& plan) {
  for (const auto& stmt : plan) {
    std::cout << doccat::ddl::ToSql(stmt) << ";\n";
  }
}

static int Run(Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "setup") {
    auto report = app.deployment->Setup();
    std::cout << "installed " << report.install.merged.size() << " merge views, " << report.install.aliased.size()
              << " aliases\n";
    if (report.import) {
      std::cout << "imported " << report.import->TotalRows() << " comments\n";
    }
    return 0;
  }

  if (cmd == "remove") {
    app.deployment->Remove();
    return 0;
  }

  if (cmd == "install") {
    auto report = app.orchestrator->Install();
    std::cout << "installed " << report.merged.size() << " merge views, " << report.aliased.size() << " aliases\n";
    return 0;
  }

  if (cmd == "uninstall") {
    app.orchestrator->Uninstall();
    return 0;
  }

  if (cmd == "plan-install") {
    PrintPlan(app.orchestrator->PlanInstall());
    return 0;
  }

  if (cmd == "plan-uninstall") {
    PrintPlan(app.orchestrator->PlanUninstall());
    return 0;
  }

  if (cmd == "export") {
    auto cursor = app.exporter->Export();
    while (auto stmt = cursor.Next()) {
      std::cout << stmt->ToSql() << ";\n";
    }
    std::cerr << cursor.Emitted() << " statements, " << cursor.Truncated() << " truncated\n";
    return 0;
  }

  if (cmd == "to-native") {
    auto report = app.exporter->ApplyToNative(*app.catalog);
    std::cout << "applied " << report.applied << " comments (" << report.truncated << " truncated, "
              << report.unmatched << " unmatched)\n";
    return 0;
  }

  if (cmd == "from-native") {
    auto report = app.importer->ImportFromNative();
    for (const auto& kind : report.kinds) {
      std::cout << kind.kind_table << ": " << kind.rows << "\n";
    }
    return 0;
  }

  // copy-routine
  auto tx     = app.store->Begin();
  auto result = app.store->CopyRoutineComments(*tx, args[0], args[1], args[2]);
  if (result) {
    result = app.store->CopyRoutineParameterComments(*tx, args[0], args[1], args[2]);
  }
  if (!result) {
    DOCCAT_LOG_ERROR("copy-routine failed", {doccat::observability::StringField("error", result.message)});
    tx->Rollback();
    return 2;
  }
  tx->Commit();
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  std::string              config_path = argv[2];
  std::string              cmd         = argv[3];
  std::vector<std::string> args(argv + 4, argv + argc);
  if (!KnownCommand(cmd, args.size())) {
    Usage();
    return 1;
  }

  int exit_code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = doccat::config::ConfigLoader::LoadFromYaml(config_path);

    doccat::observability::InitializeTracing(config);
    doccat::observability::InitializeMetrics(config);
    doccat::observability::InitializeLogging(config);

    auto app = doccat::factory::Build(config);

    // ------------------------------------------------------------
    // Run the command
    // ------------------------------------------------------------
    auto&                           metrics = doccat::observability::Metrics::Instance();
    doccat::observability::SpanScope span("doccatctl." + cmd);
    span.SetAttribute("database", config.database().path());

    const auto start = std::chrono::steady_clock::now();
    try {
      exit_code = Run(app, cmd, args);
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      metrics.RecordOperation(cmd, false);
      throw;
    }
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);

    metrics.RecordOperation(cmd, exit_code == 0);
    metrics.ObserveOperationLatencyMs(cmd, elapsed.count());
    DOCCAT_LOG_INFO("command finished", {doccat::observability::StringField("command", cmd),
                                         doccat::observability::IntField("exit_code", exit_code)});
  } catch (const std::exception& e) {
    DOCCAT_LOG_ERROR("Fatal error", {doccat::observability::StringField("command", cmd),
                                     doccat::observability::StringField("error", e.what())});
    exit_code = 2;
  }

  doccat::observability::ShutdownLogging();
  doccat::observability::ShutdownMetrics();
  doccat::observability::ShutdownTracing();
  return exit_code;
}
