#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "mlmeta_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
store:
  sqlite:
    path: "C:\\mlmeta\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = mlmeta::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().sqlite().path() == "C:\\mlmeta\\\"quoted\"\\db.sqlite");
  assert(config.store().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
store:
  memory: {}
)");

  auto config = mlmeta::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.store().has_memory());
}

void TestNumericStringsStayStrings() {
  auto config = mlmeta::config::ConfigLoader::LoadFromYamlString(R"(logging:
  level: "1"
listing:
  default_run_limit: 50
store:
  query_page_size: 200
)");
  assert(config.logging().level() == "1");
  assert(config.listing().default_run_limit() == 50);
  assert(config.store().query_page_size() == 200);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)mlmeta::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)mlmeta::config::ConfigLoader::LoadFromYaml("/nonexistent/mlmeta.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyConfigGetsDefaults() {
  auto config = mlmeta::config::ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(!config.store().has_sqlite());
  assert(config.store().query_page_size() == 0);
}

void TestEnvironmentOverrides() {
  setenv("MLMETA_BIND_ADDRESS", "127.0.0.1:6000", 1);
  setenv("MLMETA_SQLITE_PATH", "/tmp/override.db", 1);

  auto config = mlmeta::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "0.0.0.0:50051"
store:
  memory: {}
)");

  unsetenv("MLMETA_BIND_ADDRESS");
  unsetenv("MLMETA_SQLITE_PATH");

  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.store().has_sqlite());
  assert(config.store().sqlite().path() == "/tmp/override.db");
}

void TestShippedExamplesLoad() {
  const std::filesystem::path examples = std::filesystem::path(MLMETA_SOURCE_DIR) / "examples" / "config";

  auto sqlite = mlmeta::config::ConfigLoader::LoadFromYaml((examples / "mlmeta.yaml").string());
  assert(sqlite.store().has_sqlite());
  assert(!sqlite.store().sqlite().path().empty());
  assert(sqlite.logging().max_files() == 5);
  assert(sqlite.observability().service_name() == "mlmeta");

  auto memory = mlmeta::config::ConfigLoader::LoadFromYaml((examples / "mlmeta-memory.yaml").string());
  assert(memory.store().has_memory());
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestNumericStringsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsAnError();
  TestEmptyConfigGetsDefaults();
  TestEnvironmentOverrides();
  TestShippedExamplesLoad();

  std::cout << "mlmeta_unit_config_loader: pass\n";
  return 0;
}
