/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/운영 상태/WS 업그레이드를 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#include "fanout/http_session.hpp"

#include <chrono>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace fanout {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<EventRouter> router,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)), router_(std::move(router)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) { self->OnRead(ec, bytes_transferred); });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "fanout-core");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"presence", {{"online", snapshot.online_users}}},
                        {"messages", {{"relayed", snapshot.messages_relayed}}},
                        {"reactions", {{"applied", snapshot.reactions_applied}}},
                        {"updates", {{"published", snapshot.updates_published}}},
                        {"broadcasts", {{"skipped", snapshot.broadcasts_skipped}}}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    auto header_it = req_.base().find("X-Ops-Token");
    std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
    if (config_.ops_token.empty() || header_token != config_.ops_token) {
      return WriteJson(res, http::status::unauthorized,
                       MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"activeWebsocket", snapshot.websocket_active},
                        {"onlineUsers", snapshot.online_users},
                        {"broadcastsSkipped", snapshot.broadcasts_skipped},
                        {"errorCount", snapshot.request_errors},
                        {"storeBackend", config_.store_backend}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::WriteJson(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                            const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, std::nullopt, std::nullopt, std::string(req_.target()),
                                 static_cast<long>(latency), LogLevel::kInfo, ""});
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "fanout-core");
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    observability_->Log(LogContext{"", std::nullopt, std::nullopt, "ws.accept_failed", 0, LogLevel::kWarn,
                                   ec.message()});
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), coordinator_, router_, observability_,
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace fanout
