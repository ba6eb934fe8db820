#include "internal/routing/route_classifier.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace offline::worker::v1;
using offline::routing::RouteClassifier;
using offline::routing::RoutePolicy;
using offline::util::ParseAbsoluteUrl;

RouteClassifier MakeClassifier() {
  return RouteClassifier({"/api/v1/auth", "/api/v1/mail", "/api/v1/calendar", "/api/v1/meet", "/api/v1/docs"});
}

void TestNonGetIsPassthrough() {
  const auto classifier = MakeClassifier();
  for (const char* method : {"POST", "PUT", "DELETE", "PATCH"}) {
    const auto policy = classifier.Classify(method, ParseAbsoluteUrl("http://app.local/api/v1/mail/send"), REQUEST_MODE_CORS);
    assert((policy == RoutePolicy{ROUTE_CLASS_OTHER, STRATEGY_PASSTHROUGH}));
    assert(!policy.Intercepted());
  }
}

void TestSocketSchemesArePassthrough() {
  const auto classifier = MakeClassifier();
  const auto policy     = classifier.Classify("GET", ParseAbsoluteUrl("wss://app.local/api/v1/meet/ws"), REQUEST_MODE_UNSPECIFIED);
  assert(policy.strategy == STRATEGY_PASSTHROUGH);
}

void TestApiPrefixIsNetworkFirst() {
  const auto classifier = MakeClassifier();
  const auto policy     = classifier.Classify("GET", ParseAbsoluteUrl("http://app.local/api/v1/mail/list"), REQUEST_MODE_CORS);
  assert((policy == RoutePolicy{ROUTE_CLASS_API_CALL, STRATEGY_NETWORK_FIRST}));

  // api prefix wins over navigate mode
  const auto nav = classifier.Classify("GET", ParseAbsoluteUrl("http://app.local/api/v1/docs/1"), REQUEST_MODE_NAVIGATE);
  assert(nav.route_class == ROUTE_CLASS_API_CALL);
}

void TestNavigationAndStaticAreCacheFirst() {
  const auto classifier = MakeClassifier();

  const auto nav = classifier.Classify("GET", ParseAbsoluteUrl("http://app.local/dashboard"), REQUEST_MODE_NAVIGATE);
  assert((nav == RoutePolicy{ROUTE_CLASS_NAVIGATION, STRATEGY_CACHE_FIRST}));
  assert(nav.IsNavigation());

  const auto asset = classifier.Classify("GET", ParseAbsoluteUrl("http://app.local/static/app.js"), REQUEST_MODE_NO_CORS);
  assert((asset == RoutePolicy{ROUTE_CLASS_STATIC_ASSET, STRATEGY_CACHE_FIRST}));
}

void TestUnlistedApiVersionIsStatic() {
  const auto classifier = MakeClassifier();
  const auto policy     = classifier.Classify("GET", ParseAbsoluteUrl("http://app.local/api/v2/mail"), REQUEST_MODE_CORS);
  assert(policy.route_class == ROUTE_CLASS_STATIC_ASSET);
}

void TestClassificationIsDeterministic() {
  const auto classifier = MakeClassifier();
  const auto url        = ParseAbsoluteUrl("http://app.local/calendar");
  assert(classifier.Classify("GET", url, REQUEST_MODE_NAVIGATE) == classifier.Classify("GET", url, REQUEST_MODE_NAVIGATE));
}

} // namespace

int main() {
  TestNonGetIsPassthrough();
  TestSocketSchemesArePassthrough();
  TestApiPrefixIsNetworkFirst();
  TestNavigationAndStaticAreCacheFirst();
  TestUnlistedApiVersionIsStatic();
  TestClassificationIsDeterministic();

  std::cout << "offline_worker_unit_route_classifier: pass\n";
  return 0;
}
