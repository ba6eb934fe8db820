#pragma once

#include <memory>
#include <string>

namespace offline::lifecycle {
class LifecycleManager;
}

namespace offline::control {

enum class ControlKind {
  kUnknown,
  kActivateNow,
  kPurgeAll,
};

/*
  Accepts "ACTIVATE_NOW" (alias "SKIP_WAITING") and "PURGE_ALL"
  (alias "CLEAR_CACHE"). Anything else, including text that is not a JSON
  object with a "type" field, is ignored.
*/
ControlKind ParseControlMessage(const std::string& data);

class ControlChannel {
 public:
  explicit ControlChannel(std::shared_ptr<offline::lifecycle::LifecycleManager> lifecycle);

  ControlKind Handle(const std::string& data);

 private:
  std::shared_ptr<offline::lifecycle::LifecycleManager> lifecycle_;
};

} // namespace offline::control
