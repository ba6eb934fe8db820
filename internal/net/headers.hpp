#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "offline/worker/v1/http.pb.h"

namespace offline::net {

// Header names compare case-insensitively.
std::optional<std::string> FindHeader(const offline::worker::v1::HttpResponse& response, std::string_view name);

// Replaces every header called `name` with a single one.
void SetHeader(offline::worker::v1::HttpResponse* response, std::string_view name, std::string_view value);

} // namespace offline::net
