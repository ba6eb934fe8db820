#include "http_fetcher.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <string>

#include "internal/util/errors.hpp"

namespace offline::net {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace asio  = boost::asio;
using tcp       = asio::ip::tcp;

using offline::worker::v1::HttpRequest;
using offline::worker::v1::HttpResponse;

namespace {

// Upper bound for a single response body held in memory.
constexpr std::uint64_t kBodyLimit = 64ull * 1024 * 1024;

[[noreturn]] void Fail(const std::string& url, const char* what, const beast::error_code& ec) {
  throw offline::util::NetworkError(std::string(what) + " " + url + ": " + ec.message());
}

} // namespace

HttpFetcher::HttpFetcher(offline::util::Url origin, std::chrono::milliseconds io_timeout)
    : origin_(std::move(origin)), io_timeout_(io_timeout) {
}

HttpResponse HttpFetcher::Fetch(const HttpRequest& request) {
  const auto url = offline::util::ResolveUrl(request.url(), origin_);
  const auto full_url = url.ToString();

  if (url.scheme != "http") {
    throw offline::util::NetworkError("unsupported scheme for upstream fetch: " + url.scheme);
  }

  asio::io_context   ioc;
  tcp::resolver      resolver(ioc);
  beast::tcp_stream  stream(ioc);
  beast::error_code  ec;

  const auto endpoints = resolver.resolve(url.host, std::to_string(url.EffectivePort()), ec);
  if (ec) Fail(full_url, "resolve", ec);

  stream.expires_after(io_timeout_);
  stream.connect(endpoints, ec);
  if (ec) Fail(full_url, "connect", ec);

  http::request<http::string_body> req;
  const auto verb = http::string_to_verb(request.method());
  if (verb == http::verb::unknown) {
    req.method_string(request.method());
  } else {
    req.method(verb);
  }
  req.target(url.PathAndQuery());
  req.version(11);
  req.set(http::field::host, url.port ? url.host + ":" + std::to_string(url.port) : url.host);
  req.set(http::field::user_agent, "offline-worker/" BOOST_BEAST_VERSION_STRING);
  for (const auto& header : request.headers()) {
    req.set(header.name(), header.value());
  }
  req.keep_alive(false);
  if (!request.body().empty()) {
    req.body() = request.body();
  }
  req.prepare_payload();

  http::write(stream, req, ec);
  if (ec) Fail(full_url, "write", ec);

  beast::flat_buffer                         buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kBodyLimit);
  http::read(stream, buffer, parser, ec);
  if (ec) Fail(full_url, "read", ec);

  const auto& res = parser.get();

  HttpResponse response;
  response.set_status(res.result_int());
  response.set_status_text(std::string(res.reason()));
  for (const auto& field : res) {
    auto* header = response.add_headers();
    header->set_name(std::string(field.name_string()));
    header->set_value(std::string(field.value()));
  }
  response.set_body(res.body());
  response.set_source(offline::worker::v1::RESPONSE_SOURCE_NETWORK);

  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  // not_connected happens sometimes on shutdown; the response is complete either way

  return response;
}

} // namespace offline::net
