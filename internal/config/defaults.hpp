#pragma once

#include "config/config.pb.h"

namespace offline::config {

inline constexpr const char* kDefaultBindAddress    = "127.0.0.1:50061";
inline constexpr const char* kDefaultUpstreamOrigin = "http://127.0.0.1:8000";
inline constexpr uint32_t    kDefaultIoTimeoutMs    = 30000;

inline constexpr uint32_t    kDefaultCacheVersion = 1;
inline constexpr const char* kStaticPrefix        = "static";
inline constexpr const char* kDynamicPrefix       = "dynamic";
inline constexpr const char* kOfflinePage         = "/offline";

inline constexpr const char* kDefaultNotificationTitle = "Workspace";
inline constexpr const char* kDefaultNotificationBody  = "You have a new notification";
inline constexpr const char* kDefaultNotificationIcon  = "/icons/icon-192.png";
inline constexpr const char* kDefaultNotificationBadge = "/icons/badge-72.png";
inline constexpr const char* kDefaultNotificationTag   = "workspace-notification";
inline constexpr const char* kDefaultNotificationUrl   = "/dashboard";

inline constexpr const char* kDefaultOutboxTag = "mail-outbox";

/*
  Fill every unset section with the built-in deployment values:

    precache:     / /dashboard /mail /meet /docs /calendar /offline /manifest.json
    api_prefixes: /api/v1/{auth,mail,calendar,meet,docs}
    sync:         sync-mail, sync-calendar
*/
void ApplyDefaults(offline::runtime::config::RuntimeConfig* config);

offline::runtime::config::RuntimeConfig DefaultConfig();

} // namespace offline::config
