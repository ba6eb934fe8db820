#pragma once

#include <string>

#include "internal/cache/cache_storage.hpp"
#include "internal/util/url.hpp"
#include "offline/worker/v1/http.pb.h"

namespace offline::strategy {

/*
  Substitute responses when neither network nor cache can answer.

    NAVIGATION → the pre-warmed offline page from the static generation
    otherwise  → 503 {"error":"Offline","message":"Please check your connection"}

  A navigation fallback with no offline page is a configuration error and is
  reported as util::InvalidState.
*/
class OfflineFallback {
 public:
  OfflineFallback(offline::cache::CacheStoragePtr storage, offline::util::Url origin, std::string offline_page);

  offline::worker::v1::HttpResponse For(offline::worker::v1::RouteClass kind, const std::string& static_generation) const;

  offline::worker::v1::HttpResponse OfflinePage(const std::string& static_generation) const;

  static offline::worker::v1::HttpResponse ServiceUnavailable();

 private:
  offline::cache::CacheStoragePtr storage_;
  std::string                     offline_page_key_;
};

} // namespace offline::strategy
