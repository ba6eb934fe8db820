#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "offline_worker_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
upstream:
  origin: "http://app.local:8080"
  io_timeout_ms: 5000
cache:
  version: 7
  sqlite:
    path: "/tmp/offline/cache.db"
routes:
  offline_page: "/offline.html"
  precache: ["/", "/offline.html"]
  api_prefixes: ["/api/v2"]
lifecycle:
  skip_waiting: true
notifications:
  title: "Mail"
sync:
  workers: 3
  tasks:
    - tag: "sync-docs"
      path: "/api/v2/docs/sync"
      invalidate_prefixes: ["/api/v2/docs"]
outbox:
  enabled: true
  tag: "docs-outbox"
  prefixes: ["/api/v2/docs"]
)");

  const auto config = offline::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.upstream().origin() == "http://app.local:8080");
  assert(config.upstream().io_timeout_ms() == 5000);
  assert(config.cache().version() == 7);
  assert(config.cache().has_sqlite());
  assert(config.cache().sqlite().path() == "/tmp/offline/cache.db");
  assert(config.routes().precache_size() == 2);
  assert(config.routes().api_prefixes_size() == 1);
  assert(config.lifecycle().skip_waiting());
  assert(config.notifications().title() == "Mail");
  // sections given partially keep their unset fields defaulted
  assert(config.notifications().url() == "/dashboard");
  assert(config.sync().workers() == 3);
  assert(config.sync().tasks_size() == 1);
  assert(config.sync().tasks(0).tag() == "sync-docs");
  assert(config.outbox().enabled());
  assert(config.outbox().tag() == "docs-outbox");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_numbers",
                                   R"(cache:
  static_prefix: "1"
sync:
  tasks:
    - tag: "2024"
      path: "/api/v1/sync"
)");

  const auto config = offline::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.cache().static_prefix() == "1");
  assert(config.sync().tasks(0).tag() == "2024");
}

void TestEmptyFileUsesDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  const auto config = offline::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:50061");
  assert(config.cache().version() == 1);
  assert(config.cache().has_memory());
  assert(config.cache().static_prefix() == "static");
  assert(config.routes().offline_page() == "/offline");
  assert(config.routes().precache_size() == 8);
  assert(config.routes().api_prefixes_size() == 5);
  assert(config.notifications().vibrate_size() == 3);
  assert(config.notifications().actions_size() == 2);
  assert(config.sync().tasks_size() == 2);
  assert(!config.outbox().enabled());
  assert(config.outbox().tag() == "mail-outbox");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)offline::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error& ex) {
    threw = std::string(ex.what()).find("Invalid configuration") != std::string::npos;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)offline::config::ConfigLoader::LoadFromYaml("/nonexistent/offline-worker.yaml");
  } catch (const std::runtime_error& ex) {
    threw = std::string(ex.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestQuotedNumbersStayStrings();
  TestEmptyFileUsesDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "offline_worker_unit_config_loader: pass\n";
  return 0;
}
