#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "gaitrank_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/tmp/gaitrank.db"
    wal_mode: false
rating:
  default_mu: 1000
  default_sigma: 333.333
  draw_probability: 0.05
decay:
  min_days_no_decay: 28
  max_days_decay: 365
  max_decay: 0.5
fusion:
  both_known: { horse: 0.6, driver: 0.25, trainer: 0.15 }
odds:
  beta: 166.5
)");

  auto config = gaitrank::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/gaitrank.db");
  assert(config.database().sqlite().has_wal_mode() && !config.database().sqlite().wal_mode());
  assert(config.rating().has_default_mu() && config.rating().default_mu() == 1000.0);
  assert(!config.rating().has_beta());
  assert(config.rating().draw_probability() == 0.05);
  assert(config.decay().max_days_decay() == 365);
  assert(config.fusion().has_both_known() && !config.fusion().has_neither());
  assert(config.fusion().both_known().driver() == 0.25);
  assert(config.odds().beta() == 166.5);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\gaitrank\\\"quoted\"\\db.sqlite"
)");

  auto config = gaitrank::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\gaitrank\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(logging:
  pattern: "12345"
database:
  memory: {}
)");

  auto config = gaitrank::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == "12345");
  assert(config.database().has_memory());
}

void TestEmptyFileIsDefaultConfig() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = gaitrank::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.has_database());
  assert(!config.rating().has_default_mu());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(rating:
  default_mu: 1000
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)gaitrank::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)gaitrank::config::ConfigLoader::LoadFromYaml("/nonexistent/gaitrank/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("/nonexistent/gaitrank/config.yaml") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyFileIsDefaultConfig();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "gaitrank_unit_config_loader: pass\n";
  return 0;
}
