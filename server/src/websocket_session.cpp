/*
 * 설명: WebSocket 텍스트 프레임을 읽어 RoomCoordinator 로 전달하고, 송신 큐 한도를 넘으면 연결을 닫는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "codebattle/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace codebattle {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<RoomCoordinator> coordinator,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), coordinator_(std::move(coordinator)), observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { NotifyDisconnect(); }

void WebSocketSession::Run() {
  connection_id_ = coordinator_->Connect(shared_from_this());
  DoRead();
}

void WebSocketSession::Send(std::string message) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(),
                    [self, message = std::move(message)]() mutable { self->EnqueueMessage(std::move(message)); });
}

void WebSocketSession::DoRead() {
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (ec != boost::beast::websocket::error::closed && observability_) {
      observability_->Log(LogContext{LogLevel::kDebug, "ws_read_failed", connection_id_, std::nullopt, std::nullopt,
                                     ec.message()});
    }
    NotifyDisconnect();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (!closing_) {
    coordinator_->HandleMessage(connection_id_, data);
  }
  DoRead();
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
  if (ec) {
    closing_ = true;
    return;
  }
  writing_ = false;
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  if (observability_) {
    observability_->Log(LogContext{LogLevel::kWarn, "backpressure_exceeded", connection_id_, std::nullopt,
                                   std::nullopt, ""});
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::NotifyDisconnect() {
  if (disconnected_ || connection_id_.empty()) {
    return;
  }
  disconnected_ = true;
  coordinator_->Disconnect(connection_id_, this);
}

}  // namespace codebattle
