#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "errors.hpp"

namespace offline::util {

namespace {

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

uint16_t DefaultPort(const std::string& scheme) {
  if (scheme == "http" || scheme == "ws") return 80;
  if (scheme == "https" || scheme == "wss") return 443;
  return 0;
}

std::string_view StripFragment(std::string_view raw) {
  auto hash = raw.find('#');
  return hash == std::string_view::npos ? raw : raw.substr(0, hash);
}

void SplitPathAndQuery(std::string_view rest, Url* url) {
  auto q = rest.find('?');
  std::string_view path = q == std::string_view::npos ? rest : rest.substr(0, q);
  url->query            = q == std::string_view::npos ? std::string{} : std::string(rest.substr(q + 1));
  url->path             = path.empty() ? std::string{"/"} : std::string(path);
}

// scheme ":" with RFC 3986 scheme characters
std::string_view::size_type SchemeEnd(std::string_view raw) {
  for (std::string_view::size_type i = 0; i < raw.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(raw[i]);
    if (c == ':') return i == 0 ? std::string_view::npos : i;
    if (std::isalpha(c)) continue;
    if (i > 0 && (std::isdigit(c) || c == '+' || c == '-' || c == '.')) continue;
    return std::string_view::npos;
  }
  return std::string_view::npos;
}

void ParseAuthority(std::string_view authority, Url* url) {
  auto at = authority.rfind('@');
  if (at != std::string_view::npos) authority = authority.substr(at + 1);

  // an IPv6 literal keeps its colons; only one after ']' starts the port
  auto colon   = authority.rfind(':');
  auto bracket = authority.rfind(']');
  if (colon != std::string_view::npos && (bracket == std::string_view::npos || colon > bracket)) {
    auto port_str = authority.substr(colon + 1);
    authority     = authority.substr(0, colon);
    if (!port_str.empty()) {
      unsigned long port = 0;
      for (char c : port_str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) throw InvalidArgument("invalid port in URL");
        port = port * 10 + static_cast<unsigned long>(c - '0');
        if (port > 65535) throw InvalidArgument("port out of range in URL");
      }
      url->port = static_cast<uint16_t>(port);
    }
  }

  url->host = Lower(authority);
  if (url->port == DefaultPort(url->scheme)) url->port = 0;
}

} // namespace

uint16_t Url::EffectivePort() const {
  return port != 0 ? port : DefaultPort(scheme);
}

std::string Url::Origin() const {
  std::string out = scheme + "://" + host;
  if (port != 0) out += ":" + std::to_string(port);
  return out;
}

std::string Url::PathAndQuery() const {
  return query.empty() ? path : path + "?" + query;
}

std::string Url::ToString() const {
  return Origin() + PathAndQuery();
}

Url ParseAbsoluteUrl(std::string_view raw) {
  raw = StripFragment(raw);

  auto scheme_end = SchemeEnd(raw);
  if (scheme_end == std::string_view::npos) {
    throw InvalidArgument("URL has no scheme: " + std::string(raw));
  }

  Url url;
  url.scheme = Lower(raw.substr(0, scheme_end));

  auto rest = raw.substr(scheme_end + 1);
  if (rest.substr(0, 2) == "//") {
    rest            = rest.substr(2);
    auto path_start = rest.find_first_of("/?");
    ParseAuthority(rest.substr(0, path_start), &url);
    rest = path_start == std::string_view::npos ? std::string_view{} : rest.substr(path_start);
  }

  SplitPathAndQuery(rest, &url);
  return url;
}

Url ResolveUrl(std::string_view raw, const Url& base) {
  raw = StripFragment(raw);

  if (SchemeEnd(raw) != std::string_view::npos) {
    return ParseAbsoluteUrl(raw);
  }

  if (raw.substr(0, 2) == "//") {
    return ParseAbsoluteUrl(base.scheme + ":" + std::string(raw));
  }

  Url url    = base;
  url.query.clear();

  if (raw.empty()) {
    url.query = base.query;
    return url;
  }

  if (raw.front() == '/') {
    SplitPathAndQuery(raw, &url);
    return url;
  }

  if (raw.front() == '?') {
    url.query = std::string(raw.substr(1));
    return url;
  }

  // path-relative: replace the last segment of the base path
  auto slash     = base.path.rfind('/');
  auto directory = slash == std::string::npos ? std::string{"/"} : base.path.substr(0, slash + 1);
  SplitPathAndQuery(directory + std::string(raw), &url);
  return url;
}

bool SameOrigin(const Url& a, const Url& b) {
  return a.scheme == b.scheme && a.host == b.host && a.EffectivePort() == b.EffectivePort();
}

bool HasPathPrefix(std::string_view path, std::string_view prefix) {
  return path.substr(0, prefix.size()) == prefix;
}

} // namespace offline::util
