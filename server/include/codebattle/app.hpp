/*
 * 설명: 서버 전체 수명주기(구성 요소 조립, 스냅샷 복원, 리스너, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "codebattle/challenge_catalog.hpp"
#include "codebattle/config.hpp"
#include "codebattle/connection_registry.hpp"
#include "codebattle/db_client.hpp"
#include "codebattle/durable_store.hpp"
#include "codebattle/observability.hpp"
#include "codebattle/room_coordinator.hpp"
#include "codebattle/room_persistence.hpp"
#include "codebattle/room_store.hpp"

namespace codebattle {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

 private:
  void SetupPersistence();
  void StopPersistence();
  void RunWorkers();
  std::size_t ThreadCount() const;

  AppConfig config_;
  // DB 쓰기는 요청 처리 컨텍스트와 분리된 전용 컨텍스트/스레드에서 수행한다.
  // 세션 핸들러가 ioc_ 와 함께 파괴될 때까지 살아 있어야 하므로 ioc_ 보다 먼저 선언한다.
  boost::asio::io_context persistence_ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> persistence_guard_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<RoomStore> store_;
  std::shared_ptr<ChallengeCatalog> challenges_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<MariaDbDurableStore> durable_store_;
  std::shared_ptr<RoomPersistence> persistence_;
  std::shared_ptr<RoomCoordinator> coordinator_;
  std::vector<std::thread> workers_;
  std::thread persistence_thread_;
  std::atomic<bool> running_{false};
};

}  // namespace codebattle
