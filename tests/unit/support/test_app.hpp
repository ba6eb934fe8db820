#pragma once

#include <memory>
#include <string>

#include "fake_fetcher.hpp"
#include "internal/config/defaults.hpp"
#include "internal/factory.hpp"

namespace offline::test {

inline constexpr const char* kTestOrigin = "http://app.local";

/*
  Memory-backed configuration against http://app.local with a small
  manifest and the outbox enabled.
*/
inline offline::runtime::config::RuntimeConfig TestConfig() {
  auto config = offline::config::DefaultConfig();
  config.mutable_upstream()->set_origin(kTestOrigin);

  auto* routes = config.mutable_routes();
  routes->clear_precache();
  routes->add_precache("/");
  routes->add_precache("/offline");
  routes->add_precache("/app.js");

  config.mutable_sync()->set_workers(1);
  config.mutable_outbox()->set_enabled(true);
  return config;
}

/*
  Full application graph over a FakeFetcher that already serves the
  manifest.
*/
struct TestApp {
  std::shared_ptr<FakeFetcher>  fetcher = std::make_shared<FakeFetcher>();
  offline::factory::Application app;

  explicit TestApp(const offline::runtime::config::RuntimeConfig& config = TestConfig()) {
    fetcher->Respond("http://app.local/", 200, "<html>home</html>");
    fetcher->Respond("http://app.local/offline", 200, "<html>offline</html>");
    fetcher->Respond("http://app.local/app.js", 200, "console.log(1)", "application/javascript");
    app = offline::factory::Build(config, fetcher);
  }

  ~TestApp() {
    app.StopWorkers();
  }

  TestApp(const TestApp&)            = delete;
  TestApp& operator=(const TestApp&) = delete;
};

} // namespace offline::test
