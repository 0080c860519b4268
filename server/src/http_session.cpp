/*
 * 설명: HTTP 요청을 처리하고 상태/헬스/메트릭/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "codebattle/http_session.hpp"

#include <chrono>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "codebattle/api_response.hpp"
#include "codebattle/websocket_session.hpp"

namespace codebattle {

namespace {
constexpr const char* kServerName = "codebattle-server";
constexpr const char* kBanner = "CodeBattle WebSocket Server";
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RoomCoordinator> coordinator, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)),
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
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::access_control_allow_origin, "*");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/") {
    res->result(http::status::ok);
    res->set(http::field::content_type, "text/plain; charset=utf-8");
    res->body() = kBanner;
    res->content_length(res->body().size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    auto body = MakeSuccessEnvelope(payload).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(coordinator_->LiveRoomCount());
    nlohmann::json data{{"connections", {{"websocket", snapshot.websocket_active}}},
                        {"rooms", {{"live", snapshot.live_rooms}, {"created", snapshot.rooms_created}}},
                        {"games", {{"ended", snapshot.games_ended}}},
                        {"failures",
                         {{"delivery", snapshot.delivery_failures},
                          {"persistence", snapshot.persistence_failures},
                          {"malformed", snapshot.malformed_messages}}}};
    auto body = MakeSuccessEnvelope(data).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  res->result(http::status::not_found);
  auto body = MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다").dump();
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    observability_->Log(LogContext{LogLevel::kDebug, "http_request", std::nullopt, std::nullopt, std::nullopt,
                                   std::string(req_.target()) + " " + std::to_string(res->result_int())});
  }
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                                  });
}

void HttpSession::HandleWebSocket() {
  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    if (observability_) {
      observability_->Log(LogContext{LogLevel::kWarn, "ws_accept_failed", std::nullopt, std::nullopt, std::nullopt,
                                     ec.message()});
    }
    boost::beast::error_code ignored;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), coordinator_, observability_, config_.ws_queue_limit_messages,
                                     config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace codebattle
