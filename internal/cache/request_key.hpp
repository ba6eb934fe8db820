#pragma once

#include <string>
#include <string_view>

#include "internal/util/url.hpp"

namespace offline::cache {

/*
  Request identity inside a generation: upper-cased method, a space, then the
  normalized absolute URL without fragment.

      "GET http://app.local/api/v1/mail/list?page=2"
*/
std::string RequestKey(std::string_view method, const offline::util::Url& url);

/*
  Key prefix selecting every GET entry under `path_prefix` on `origin`.
*/
std::string RequestKeyPrefix(const offline::util::Url& origin, std::string_view path_prefix);

} // namespace offline::cache
