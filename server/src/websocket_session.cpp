/*
 * 설명: WebSocket 메시지를 읽어 이벤트 라우터로 넘기고 서버 이벤트를 strand 위에서 순서대로 전송한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/presence_flow_test.cpp
 */
#include "fanout/websocket_session.hpp"

#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace fanout {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<EventRouter> router, std::shared_ptr<Observability> observability,
                                   std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ws_(std::move(ws)), coordinator_(std::move(coordinator)), router_(std::move(router)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { coordinator_->Detach(ctx_.id); }

void WebSocketSession::Run() {
  ctx_.id = coordinator_->Attach(shared_from_this());
  observability_->Log(LogContext{"", std::nullopt, ctx_.id, "ws.connected", 0, LogLevel::kDebug, ""});
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return HandleClosed();
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec || closing_) {
    return HandleClosed();
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  HandleFrame(data);
  DoRead();
}

void WebSocketSession::HandleFrame(const std::string& data) {
  WsEnvelope env{};
  std::string error_message;
  if (!ParseInboundFrame(data, env, error_message)) {
    SendError("bad_request", error_message, env.seq);
    return;
  }

  const auto started = std::chrono::steady_clock::now();
  const auto trace_id = observability_->NextTraceId();
  bool routed = false;
  try {
    routed = router_->Dispatch(ctx_, env.event, env.payload, error_message);
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{trace_id, ctx_.user_id, ctx_.id, env.event, 0, LogLevel::kError, ex.what()});
    SendError("internal_error", "이벤트 처리 중 오류가 발생했습니다", env.seq);
    return;
  }
  if (!routed) {
    SendError("bad_request", error_message, env.seq);
  }
  const auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  observability_->Log(LogContext{trace_id, ctx_.user_id, ctx_.id, "ws." + env.event, static_cast<long>(latency),
                                 routed ? LogLevel::kDebug : LogLevel::kWarn, routed ? "" : error_message});
}

void WebSocketSession::HandleClosed() {
  // 읽기 루프 종료는 연결당 한 번만 연결 종료 처리로 이어진다.
  if (disconnected_) {
    return;
  }
  disconnected_ = true;
  closing_ = true;
  router_->HandleDisconnect(ctx_);
  coordinator_->Detach(ctx_.id);
  observability_->Log(LogContext{"", ctx_.user_id, ctx_.id, "ws.disconnected", 0, LogLevel::kDebug, ""});
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  WsEnvelope env{.type = "event", .event = event, .seq = 0, .payload = payload};
  PostMessage(ToWsJson(env).dump());
}

void WebSocketSession::SendServerError(const std::string& code, const std::string& message) {
  WsEnvelope env{.type = "error", .event = "", .seq = 0, .payload = {{"code", code}, {"message", message}}};
  PostMessage(ToWsJson(env).dump());
}

void WebSocketSession::PostMessage(std::string message) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  observability_->Log(LogContext{"", ctx_.user_id, ctx_.id, "ws.backpressure_exceeded", 0, LogLevel::kWarn,
                                 "queued=" + std::to_string(send_queue_.size())});
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  if (writing_) {
    // 진행 중인 쓰기가 끝난 뒤 닫는다. 버퍼는 완료 전까지 살아 있어야 한다.
    while (send_queue_.size() > 1) {
      queued_bytes_ -= send_queue_.back().size();
      send_queue_.pop_back();
    }
  } else {
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace fanout
