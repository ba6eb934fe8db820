#include "defaults.hpp"

#include <string>

namespace offline::config {

using offline::runtime::config::RuntimeConfig;

namespace {

void SetIfEmpty(std::string* field, const char* value) {
  if (field->empty()) *field = value;
}

void ApplyCacheDefaults(offline::runtime::config::CacheConfig* cache) {
  if (cache->version() == 0) cache->set_version(kDefaultCacheVersion);
  SetIfEmpty(cache->mutable_static_prefix(), kStaticPrefix);
  SetIfEmpty(cache->mutable_dynamic_prefix(), kDynamicPrefix);
  if (cache->backend_case() == offline::runtime::config::CacheConfig::BACKEND_NOT_SET) {
    cache->mutable_memory();
  }
}

void ApplyRouteDefaults(offline::runtime::config::RoutesConfig* routes) {
  SetIfEmpty(routes->mutable_offline_page(), kOfflinePage);

  if (routes->precache_size() == 0) {
    for (const char* path : {"/", "/dashboard", "/mail", "/meet", "/docs", "/calendar", "/offline", "/manifest.json"}) {
      routes->add_precache(path);
    }
  }

  if (routes->api_prefixes_size() == 0) {
    for (const char* prefix : {"/api/v1/auth", "/api/v1/mail", "/api/v1/calendar", "/api/v1/meet", "/api/v1/docs"}) {
      routes->add_api_prefixes(prefix);
    }
  }
}

void ApplyNotificationDefaults(offline::runtime::config::NotificationDefaults* n) {
  SetIfEmpty(n->mutable_title(), kDefaultNotificationTitle);
  SetIfEmpty(n->mutable_body(), kDefaultNotificationBody);
  SetIfEmpty(n->mutable_icon(), kDefaultNotificationIcon);
  SetIfEmpty(n->mutable_badge(), kDefaultNotificationBadge);
  SetIfEmpty(n->mutable_tag(), kDefaultNotificationTag);
  SetIfEmpty(n->mutable_url(), kDefaultNotificationUrl);

  if (n->vibrate_size() == 0) {
    for (uint32_t v : {100u, 50u, 100u}) n->add_vibrate(v);
  }

  if (n->actions_size() == 0) {
    auto* open = n->add_actions();
    open->set_action("open");
    open->set_title("Open");
    auto* dismiss = n->add_actions();
    dismiss->set_action("dismiss");
    dismiss->set_title("Dismiss");
  }
}

void ApplySyncDefaults(offline::runtime::config::SyncConfig* sync) {
  if (sync->workers() == 0) sync->set_workers(2);

  if (sync->tasks_size() == 0) {
    auto* mail = sync->add_tasks();
    mail->set_tag("sync-mail");
    mail->set_path("/api/v1/mail/sync");
    mail->add_invalidate_prefixes("/api/v1/mail");

    auto* calendar = sync->add_tasks();
    calendar->set_tag("sync-calendar");
    calendar->set_path("/api/v1/calendar/sync");
    calendar->add_invalidate_prefixes("/api/v1/calendar");
  }
}

} // namespace

void ApplyDefaults(RuntimeConfig* config) {
  SetIfEmpty(config->mutable_server()->mutable_bind_address(), kDefaultBindAddress);

  auto* upstream = config->mutable_upstream();
  SetIfEmpty(upstream->mutable_origin(), kDefaultUpstreamOrigin);
  if (upstream->io_timeout_ms() == 0) upstream->set_io_timeout_ms(kDefaultIoTimeoutMs);

  ApplyCacheDefaults(config->mutable_cache());
  ApplyRouteDefaults(config->mutable_routes());
  ApplyNotificationDefaults(config->mutable_notifications());
  ApplySyncDefaults(config->mutable_sync());

  auto* outbox = config->mutable_outbox();
  SetIfEmpty(outbox->mutable_tag(), kDefaultOutboxTag);
  if (outbox->prefixes_size() == 0) outbox->add_prefixes("/api/v1/mail");
}

RuntimeConfig DefaultConfig() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

} // namespace offline::config
