#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "config/config.pb.h"
#include "offline/worker/v1/notification.pb.h"

namespace offline::push {

// Payload decoded as the structured push schema.
struct ParsedPush {
  offline::worker::v1::PushMessage message;
};

// Payload that is not the structured schema; shown verbatim as the body.
struct RawPush {
  std::string text;
};

using DecodedPush = std::variant<ParsedPush, RawPush>;

/*
  Never fails: a missing payload decodes to an empty ParsedPush, anything
  that is not a JSON object matching the schema decodes to RawPush.
  Unknown JSON fields are ignored.
*/
DecodedPush DecodePush(const std::string& data, bool has_data);

/*
  Produce a complete notification. Empty fields take the configured
  defaults; vibrate always comes from the defaults.
*/
offline::worker::v1::Notification Normalize(const DecodedPush&                                    decoded,
                                            const offline::runtime::config::NotificationDefaults& defaults,
                                            uint64_t                                              timestamp_ms);

} // namespace offline::push
