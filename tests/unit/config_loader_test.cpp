#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cascade_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "/var/lib/cascade/cascade.db"
delete_operations:
  max_concurrent_per_actor: 3
  retry_after: 45s
  batch_size: 25
  poll_interval: 0.25s
  operation_retention: 3600s
  entity_retention: 86400s
  worker_threads: 4
authorization:
  mode: AUTHORIZATION_MODE_ALLOW_ALL
logging:
  level: "debug"
)");

  auto config = cascade::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/cascade/cascade.db");
  assert(config.authorization().mode() == cascade::runtime::config::AUTHORIZATION_MODE_ALLOW_ALL);
  assert(config.logging().level() == "debug");

  const auto options = cascade::config::BuildCascadeOptions(config);
  assert(options.max_concurrent_per_actor == 3);
  assert(options.retry_after == std::chrono::seconds(45));
  assert(options.batch_size == 25);
  assert(options.poll_interval == std::chrono::milliseconds(250));
  assert(options.operation_retention == std::chrono::hours(1));
  assert(options.entity_retention == std::chrono::hours(24));
  assert(options.worker_threads == 4);
  // untouched fields keep their defaults
  assert(options.discovery_page_size == 100);
  assert(options.default_list_limit == 20);
  assert(options.max_list_limit == 100);
}

void TestDefaultsWhenSectionIsAbsent() {
  auto config = cascade::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "127.0.0.1:6000"
database:
  memory: {}
)");
  assert(config.database().has_memory());

  const auto options = cascade::config::BuildCascadeOptions(config);
  assert(options.max_concurrent_per_actor == 5);
  assert(options.retry_after == std::chrono::seconds(30));
  assert(options.batch_size == 10);
  assert(options.poll_interval == std::chrono::milliseconds(500));
  assert(options.operation_retention == std::chrono::hours(24));
  assert(options.entity_retention == std::chrono::hours(24 * 90));
}

void TestQuotedNumbersStayStrings() {
  auto config = cascade::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "12345"
)");
  assert(config.server().bind_address() == "12345");
}

void TestOutOfRangeOptionsAreRejected() {
  bool batch_threw = false;
  try {
    auto config = cascade::config::ConfigLoader::LoadFromYamlString(R"(delete_operations:
  batch_size: 5000
)");
    (void)cascade::config::BuildCascadeOptions(config);
  } catch (const std::invalid_argument&) {
    batch_threw = true;
  }
  assert(batch_threw);

  bool limit_threw = false;
  try {
    auto config = cascade::config::ConfigLoader::LoadFromYamlString(R"(delete_operations:
  default_list_limit: 50
  max_list_limit: 10
)");
    (void)cascade::config::BuildCascadeOptions(config);
  } catch (const std::invalid_argument&) {
    limit_threw = true;
  }
  assert(limit_threw);

  bool negative_threw = false;
  try {
    auto config = cascade::config::ConfigLoader::LoadFromYamlString(R"(delete_operations:
  retry_after: -5s
)");
    (void)cascade::config::BuildCascadeOptions(config);
  } catch (const std::invalid_argument&) {
    negative_threw = true;
  }
  assert(negative_threw);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)cascade::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)cascade::config::ConfigLoader::LoadFromYaml("/nonexistent/cascade-manager.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsWhenSectionIsAbsent();
  TestQuotedNumbersStayStrings();
  TestOutOfRangeOptionsAreRejected();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "cascade_unit_config_loader: pass\n";
  return 0;
}
