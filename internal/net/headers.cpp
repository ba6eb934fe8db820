#include "headers.hpp"

#include <algorithm>
#include <cctype>

namespace offline::net {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

} // namespace

std::optional<std::string> FindHeader(const offline::worker::v1::HttpResponse& response, std::string_view name) {
  for (const auto& header : response.headers()) {
    if (EqualsIgnoreCase(header.name(), name)) return header.value();
  }
  return std::nullopt;
}

void SetHeader(offline::worker::v1::HttpResponse* response, std::string_view name, std::string_view value) {
  auto* headers = response->mutable_headers();
  for (int i = headers->size() - 1; i >= 0; --i) {
    if (EqualsIgnoreCase(headers->Get(i).name(), name)) headers->DeleteSubrange(i, 1);
  }
  auto* header = headers->Add();
  header->set_name(std::string(name));
  header->set_value(std::string(value));
}

} // namespace offline::net
