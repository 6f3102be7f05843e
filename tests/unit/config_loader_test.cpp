#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "lifebank_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadFails(const std::filesystem::path& path) {
  try {
    (void)lifebank::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
  pattern: "%v"
database:
  sqlite:
    path: "/tmp/lifebank/ledger.sqlite"
custody:
  cancel_cooldown_seconds: 600
  min_volume_ml: 150
  max_volume_ml: 500
  max_shelf_life_seconds: 86400
)");

  auto config = lifebank::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/lifebank/ledger.sqlite");

  auto policy = lifebank::factory::PolicyFromConfig(config);
  assert(policy.cancel_cooldown_seconds == 600);
  assert(policy.min_volume_ml == 150);
  assert(policy.max_volume_ml == 500);
  assert(policy.max_shelf_life_seconds == 86400);
}

void TestMemoryBackendAndDefaults() {
  const auto yaml_path = WriteYaml("memory_defaults",
                                   R"(database:
  memory:
custody:
  max_volume_ml: 550
)");

  auto config = lifebank::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());

  // absent values keep the built-in custody defaults
  auto policy = lifebank::factory::PolicyFromConfig(config);
  assert(policy.cancel_cooldown_seconds == 1800);
  assert(policy.min_volume_ml == 100);
  assert(policy.max_volume_ml == 550);
  assert(policy.max_shelf_life_seconds == 42 * lifebank::util::kSecondsPerDay);
}

void TestQuotedPathSurvivesConversion() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\lifebank\\\"quoted\"\\db.sqlite"
)");

  auto config = lifebank::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\lifebank\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory:
custody:
  cooldown: 5
)");

  assert(LoadFails(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  assert(LoadFails(WriteYaml("empty_sqlite_path", R"(database:
  sqlite:
    path: ""
)")));

  assert(LoadFails(WriteYaml("inverted_volume", R"(custody:
  min_volume_ml: 400
  max_volume_ml: 300
)")));

  // an unset maximum falls back to 600 ml, below this minimum
  assert(LoadFails(WriteYaml("min_above_default_max", R"(custody:
  min_volume_ml: 700
)")));

  // an unset minimum falls back to 100 ml, above this maximum
  assert(LoadFails(WriteYaml("max_below_default_min", R"(custody:
  max_volume_ml: 50
)")));

  assert(LoadFails(std::filesystem::temp_directory_path() / "lifebank_config_loader_tests" / "missing.yaml"));
}

void TestDatabasePathEnvOverride() {
  const auto sqlite_path = WriteYaml("env_override_sqlite",
                                     R"(database:
  sqlite:
    path: "/tmp/lifebank/ledger.sqlite"
)");
  const auto memory_path = WriteYaml("env_override_memory",
                                     R"(database:
  memory:
)");

  setenv("LIFEBANK_DB_PATH", "/tmp/lifebank/override.sqlite", 1);
  auto sqlite_config = lifebank::config::ConfigLoader::LoadFromYaml(sqlite_path.string());
  auto memory_config = lifebank::config::ConfigLoader::LoadFromYaml(memory_path.string());
  unsetenv("LIFEBANK_DB_PATH");

  assert(sqlite_config.database().has_sqlite());
  assert(sqlite_config.database().sqlite().path() == "/tmp/lifebank/override.sqlite");

  // the override never switches a memory config to sqlite
  assert(memory_config.database().has_memory());
  assert(!memory_config.database().has_sqlite());
}

} // namespace

int main() {
  TestFullConfig();
  TestMemoryBackendAndDefaults();
  TestQuotedPathSurvivesConversion();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestDatabasePathEnvOverride();

  std::cout << "lifebank_unit_config_loader: pass\n";
  return 0;
}
