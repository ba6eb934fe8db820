#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace offline::util {

/*
  Minimal URL model for request identity and routing.

  Scheme and host are lower-cased, default ports are elided and the fragment
  is dropped, so two spellings of the same resource compare equal.
*/
struct Url {
  std::string scheme;
  std::string host;
  uint16_t    port = 0; // 0 = scheme default
  std::string path{"/"};
  std::string query;

  uint16_t    EffectivePort() const;
  std::string Origin() const;
  std::string PathAndQuery() const;
  std::string ToString() const;

  bool IsSocketScheme() const {
    return scheme == "ws" || scheme == "wss";
  }
};

// Parses an absolute URL. Throws InvalidArgument when `raw` has no scheme.
Url ParseAbsoluteUrl(std::string_view raw);

// Resolves `raw` (absolute, scheme-relative, origin-relative or path-relative)
// against `base`.
Url ResolveUrl(std::string_view raw, const Url& base);

bool SameOrigin(const Url& a, const Url& b);

bool HasPathPrefix(std::string_view path, std::string_view prefix);

} // namespace offline::util
