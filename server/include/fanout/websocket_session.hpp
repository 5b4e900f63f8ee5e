/*
 * 설명: WebSocket 연결의 프레임 해석, 이벤트 라우팅, 백프레셔, 연결 종료 처리를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "fanout/api_response.hpp"
#include "fanout/event_router.hpp"
#include "fanout/observability.hpp"
#include "fanout/realtime.hpp"

namespace fanout {

class WebSocketSession : public EventSink, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<EventRouter> router,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 어느 스레드에서든 호출할 수 있다. 실제 큐 조작은 연결의 strand에서 수행된다.
  void SendServerEvent(const std::string& event, const nlohmann::json& payload) override;
  void SendServerError(const std::string& code, const std::string& message) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleFrame(const std::string& data);
  void HandleClosed();
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void PostMessage(std::string message);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<EventRouter> router_;
  std::shared_ptr<Observability> observability_;
  ConnectionContext ctx_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool disconnected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace fanout
