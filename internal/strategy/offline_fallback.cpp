#include "offline_fallback.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/cache/request_key.hpp"
#include "internal/net/headers.hpp"
#include "internal/util/errors.hpp"

namespace offline::strategy {

using offline::worker::v1::HttpResponse;

namespace {

constexpr const char* kOfflineError   = "Offline";
constexpr const char* kOfflineMessage = "Please check your connection";

} // namespace

OfflineFallback::OfflineFallback(offline::cache::CacheStoragePtr storage, offline::util::Url origin, std::string offline_page)
    : storage_(std::move(storage)),
      offline_page_key_(offline::cache::RequestKey("GET", offline::util::ResolveUrl(offline_page, origin))) {
}

HttpResponse OfflineFallback::For(offline::worker::v1::RouteClass kind, const std::string& static_generation) const {
  if (kind == offline::worker::v1::ROUTE_CLASS_NAVIGATION) {
    return OfflinePage(static_generation);
  }
  return ServiceUnavailable();
}

HttpResponse OfflineFallback::OfflinePage(const std::string& static_generation) const {
  std::optional<HttpResponse> page;
  if (!static_generation.empty()) {
    page = storage_->Match(static_generation, offline_page_key_);
  }
  if (!page) {
    throw offline::util::InvalidState("offline fallback: " + offline_page_key_ + " missing from " +
                                      (static_generation.empty() ? std::string("<no static generation>") : static_generation));
  }

  page->set_source(offline::worker::v1::RESPONSE_SOURCE_FALLBACK);
  return *page;
}

HttpResponse OfflineFallback::ServiceUnavailable() {
  offline::worker::v1::OfflineError error;
  error.set_error(kOfflineError);
  error.set_message(kOfflineMessage);

  std::string body;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  const auto status = google::protobuf::util::MessageToJsonString(error, &body, options);
  if (!status.ok()) {
    throw std::runtime_error("offline fallback: failed to encode payload: " + std::string(status.message()));
  }

  HttpResponse response;
  response.set_status(503);
  response.set_status_text("Service Unavailable");
  offline::net::SetHeader(&response, "Content-Type", "application/json");
  response.set_body(body);
  response.set_source(offline::worker::v1::RESPONSE_SOURCE_FALLBACK);
  return response;
}

} // namespace offline::strategy
