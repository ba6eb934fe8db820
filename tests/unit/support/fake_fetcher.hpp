#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/net/fetcher.hpp"
#include "internal/util/errors.hpp"

namespace offline::test {

/*
  Scripted network. Unknown URLs answer 404; URLs marked unreachable (or
  every URL while offline) raise NetworkError.
*/
class FakeFetcher final : public offline::net::Fetcher {
 public:
  void Respond(const std::string& url, uint32_t status, const std::string& body, const std::string& content_type = "text/html") {
    offline::worker::v1::HttpResponse response;
    response.set_status(status);
    response.set_body(body);
    auto* header = response.add_headers();
    header->set_name("Content-Type");
    header->set_value(content_type);

    std::lock_guard lock(mutex_);
    routes_[url] = response;
  }

  void Unreachable(const std::string& url) {
    std::lock_guard lock(mutex_);
    unreachable_.insert(url);
  }

  void Reachable(const std::string& url) {
    std::lock_guard lock(mutex_);
    unreachable_.erase(url);
  }

  void SetOffline(bool offline) {
    std::lock_guard lock(mutex_);
    offline_ = offline;
  }

  offline::worker::v1::HttpResponse Fetch(const offline::worker::v1::HttpRequest& request) override {
    std::lock_guard lock(mutex_);
    calls_.push_back(request.method() + " " + request.url());

    if (offline_ || unreachable_.count(request.url())) {
      throw offline::util::NetworkError("connect " + request.url() + ": connection refused");
    }

    const auto it = routes_.find(request.url());
    offline::worker::v1::HttpResponse response;
    if (it == routes_.end()) {
      response.set_status(404);
      response.set_body("not found");
    } else {
      response = it->second;
    }
    response.set_source(offline::worker::v1::RESPONSE_SOURCE_NETWORK);
    return response;
  }

  std::size_t Calls() const {
    std::lock_guard lock(mutex_);
    return calls_.size();
  }

  std::size_t Calls(const std::string& method, const std::string& url) const {
    std::lock_guard lock(mutex_);
    std::size_t     n = 0;
    for (const auto& call : calls_) {
      if (call == method + " " + url) ++n;
    }
    return n;
  }

 private:
  mutable std::mutex                                       mutex_;
  std::map<std::string, offline::worker::v1::HttpResponse> routes_;
  std::set<std::string>                                    unreachable_;
  std::vector<std::string>                                 calls_;
  bool                                                     offline_ = false;
};

} // namespace offline::test
