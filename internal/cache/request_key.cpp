#include "request_key.hpp"

#include <algorithm>
#include <cctype>

namespace offline::cache {

std::string RequestKey(std::string_view method, const offline::util::Url& url) {
  std::string key(method);
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  key += ' ';
  key += url.ToString();
  return key;
}

std::string RequestKeyPrefix(const offline::util::Url& origin, std::string_view path_prefix) {
  return "GET " + origin.Origin() + std::string(path_prefix);
}

} // namespace offline::cache
