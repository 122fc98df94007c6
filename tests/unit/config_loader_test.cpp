#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "modeldb_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ExpectRejected(const std::filesystem::path& path, const char* why) {
  bool threw = false;
  try {
    (void)modeldb::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && why);
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
registry:
  root: /srv/models
database:
  postgres:
    max_connections: 8
  sqlite:
    busy_timeout_ms: 250
    wal_mode: false
deployment:
  default_table: prod_models
)");

  auto config = modeldb::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.registry().root() == "/srv/models");
  assert(config.database().postgres().max_connections() == 8);
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.database().sqlite().has_wal_mode());
  assert(!config.database().sqlite().wal_mode());
  assert(config.deployment().default_table() == "prod_models");

  const auto options = modeldb::factory::BuildStoreOptions(config);
  assert(options.postgres_max_connections == 8);
  assert(options.sqlite_busy_timeout_ms == 250);
  assert(!options.sqlite_wal_mode);
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = modeldb::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level().empty());
  assert(!config.database().sqlite().has_wal_mode());

  const auto options = modeldb::factory::BuildStoreOptions(config);
  const modeldb::db::StoreOptions defaults;
  assert(options.postgres_max_connections == defaults.postgres_max_connections);
  assert(options.sqlite_busy_timeout_ms == defaults.sqlite_busy_timeout_ms);
  assert(options.sqlite_wal_mode == defaults.sqlite_wal_mode);

  auto runtime = modeldb::factory::Build(config);
  assert(runtime.default_table == "models");
  assert(runtime.deployer != nullptr);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_scalars",
                                   R"(registry:
  root: "C:\\models\\\"quoted\"\\root"
deployment:
  default_table: "2024"
)");

  auto config = modeldb::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.registry().root() == "C:\\models\\\"quoted\"\\root");
  assert(config.deployment().default_table() == "2024");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(logging:
  pattern: "line1\nline2☃"
)");

  auto config = modeldb::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestInvalidConfigsAreRejected() {
  ExpectRejected(WriteYaml("unknown_field", "deployment:\n  default_table: models\nunknown_field: 123\n"),
                 "ConfigLoader must reject unknown fields.");
  ExpectRejected(WriteYaml("unknown_level", "logging:\n  level: chatty\n"), "ConfigLoader must reject unknown log levels.");
  ExpectRejected(WriteYaml("top_level_list", "- logging\n- registry\n"), "ConfigLoader must reject a non-mapping document.");
  ExpectRejected(WriteYaml("wrong_type", "database:\n  postgres:\n    max_connections: many\n"),
                 "ConfigLoader must reject type mismatches.");
  ExpectRejected(std::filesystem::temp_directory_path() / "modeldb_config_loader_tests" / "does_not_exist.yaml",
                 "ConfigLoader must reject missing files.");
}

} // namespace

int main() {
  TestFullConfig();
  TestEmptyFileYieldsDefaults();
  TestQuotedScalarsStayStrings();
  TestScalarEscapingForNewlineAndUnicode();
  TestInvalidConfigsAreRejected();

  std::cout << "modeldb_unit_config_loader: pass\n";
  return 0;
}
