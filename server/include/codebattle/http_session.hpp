/*
 * 설명: HTTP 연결을 처리하고 상태/헬스/메트릭 엔드포인트 및 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "codebattle/config.hpp"
#include "codebattle/observability.hpp"
#include "codebattle/room_coordinator.hpp"

namespace codebattle {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<RoomCoordinator> coordinator, std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<RoomCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace codebattle
