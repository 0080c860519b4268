/*
 * 설명: WebSocket 연결의 수신 루프와 백프레셔 송신 큐를 관리하고 메시지를 RoomCoordinator 로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "codebattle/connection_registry.hpp"
#include "codebattle/room_coordinator.hpp"

namespace codebattle {

class WebSocketSession : public ConnectionHandle, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<RoomCoordinator> coordinator, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 어느 스레드에서 호출해도 된다. 실제 큐 적재는 연결 strand 에서 수행한다.
  void Send(std::string message) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void NotifyDisconnect();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<RoomCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  std::string connection_id_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool disconnected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace codebattle
