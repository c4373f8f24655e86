#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "doccat_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Throws(const std::string& yaml_text) {
  try {
    (void)doccat::config::ConfigLoader::LoadFromYamlString(yaml_text);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full", R"(database:
  path: "/var/lib/doccat/catalog.db"
  busy_timeout_ms: 250
  wal_mode: true
namespaces:
  native: "SYSCAT"
  extended: "NOTES"
  merged: "DOCS"
logging:
  level: "debug"
sync:
  import_on_setup: true
)");

  auto config = doccat::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().path() == "/var/lib/doccat/catalog.db");
  assert(config.database().busy_timeout_ms() == 250);
  assert(config.database().wal_mode());
  assert(config.namespaces().extended() == "NOTES");
  assert(config.namespaces().merged() == "DOCS");
  assert(config.logging().level() == "debug");
  assert(config.sync().import_on_setup());
}

void TestDefaultsAreFilled() {
  auto config = doccat::config::ConfigLoader::LoadFromYamlString(R"(database:
  path: ":memory:"
)");

  assert(config.database().busy_timeout_ms() == 5000);
  assert(!config.database().wal_mode());
  assert(config.namespaces().native() == "SYSCAT");
  assert(config.namespaces().extended() == "DOCDATA");
  assert(config.namespaces().merged() == "DOCCAT");
  assert(!config.sync().import_on_setup());
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted", R"(database:
  path: "C:\\doccat\\\"quoted\"\\db.sqlite"
namespaces:
  extended: "2024"
)");

  auto config = doccat::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().path() == "C:\\doccat\\\"quoted\"\\db.sqlite");
  assert(config.namespaces().extended() == "2024");
}

void TestUnknownFieldsAreRejected() {
  assert(Throws(R"(database:
  path: "/tmp/doccat.db"
unknown_field: 123
)"));
}

void TestMissingDatabasePathIsRejected() {
  assert(Throws(R"(namespaces:
  merged: "DOCCAT"
)"));
}

void TestInvalidNamespacesAreRejected() {
  assert(Throws(R"(database:
  path: "/tmp/doccat.db"
namespaces:
  extended: "DOC.DATA"
)"));

  assert(Throws(R"(database:
  path: "/tmp/doccat.db"
namespaces:
  extended: "DOCCAT"
  merged: "DOCCAT"
)"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)doccat::config::ConfigLoader::LoadFromYaml("/nonexistent/doccat/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsAreFilled();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingDatabasePathIsRejected();
  TestInvalidNamespacesAreRejected();
  TestMissingFileIsReported();

  std::cout << "doccat_unit_config_loader: pass\n";
  return 0;
}
