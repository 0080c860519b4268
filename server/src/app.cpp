/*
 * 설명: 서버 구성 요소를 조립하고 스냅샷 복원, 리스닝, 워커 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "codebattle/app.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "codebattle/http_session.hpp"

namespace codebattle {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RoomCoordinator> coordinator, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), coordinator_(std::move(coordinator)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->coordinator_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<RoomCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), persistence_ioc_(1), persistence_guard_(boost::asio::make_work_guard(persistence_ioc_)),
      ioc_(static_cast<int>(ThreadCount())), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>();
  observability_->SetMinLevel(ParseLogLevel(config.log_level));
  registry_ = std::make_shared<ConnectionRegistry>();
  registry_->SetObservability(observability_);
  store_ = std::make_shared<RoomStore>();
  challenges_ = config.challenge_file.empty() ? ChallengeCatalog::BuiltIn()
                                              : ChallengeCatalog::LoadFromFile(config.challenge_file);
  observability_->Log(LogContext{LogLevel::kInfo, "challenges_loaded", std::nullopt, std::nullopt, std::nullopt,
                                 std::to_string(challenges_->Size())});

  if (config.persistence_enabled) {
    SetupPersistence();
  }

  CoordinatorConfig coordinator_config;
  coordinator_config.session_time_budget = std::chrono::seconds(config.session_time_budget_seconds);
  // 생성자에서 복원된 방의 참가자 색인을 만든다.
  coordinator_ = std::make_shared<RoomCoordinator>(store_, registry_, challenges_, persistence_, observability_,
                                                   coordinator_config);
  if (persistence_) {
    persistence_thread_ = std::thread([this]() { persistence_ioc_.run(); });
  }
}

ServerApp::~ServerApp() {
  Stop();
  if (coordinator_) {
    coordinator_->BeginShutdown();
  }
  StopPersistence();
}

void ServerApp::SetupPersistence() {
  DbConfig db_config{config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  durable_store_ = std::make_shared<MariaDbDurableStore>(db_client_);
  try {
    durable_store_->EnsureSchema();
  } catch (const std::exception& ex) {
    observability_->IncrementPersistenceFailure();
    observability_->Log(LogContext{LogLevel::kError, "schema_setup_failed", std::nullopt, std::nullopt, std::nullopt,
                                   ex.what()});
  }
  persistence_ = std::make_shared<RoomPersistence>(persistence_ioc_, durable_store_, config_.snapshot_key,
                                                   observability_);
  if (persistence_->Restore(*store_)) {
    observability_->Log(LogContext{LogLevel::kInfo, "rooms_restored", std::nullopt, std::nullopt, std::nullopt,
                                   std::to_string(store_->Size())});
  }
}

void ServerApp::StopPersistence() {
  // 가드를 풀면 대기 중인 쓰기를 모두 처리한 뒤 run() 이 반환된다.
  persistence_guard_.reset();
  if (persistence_thread_.joinable()) {
    persistence_thread_.join();
  }
}

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, observability_);
    listener_->Run();
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::beast::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Log(LogContext{LogLevel::kInfo, "signal_received", std::nullopt, std::nullopt, std::nullopt,
                                     std::to_string(signal_number)});
      coordinator_->BeginShutdown();
      work_guard_.reset();
      listener_->Stop();
      ioc_.stop();
    });
    observability_->Log(LogContext{LogLevel::kInfo, "server_started", std::nullopt, std::nullopt, std::nullopt,
                                   "port=" + std::to_string(config_.port)});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kError, "server_failed", std::nullopt, std::nullopt, std::nullopt,
                                   ex.what()});
  }
}

std::size_t ServerApp::ThreadCount() const {
  if (config_.worker_threads > 0) {
    return config_.worker_threads;
  }
  return std::max(1u, std::thread::hardware_concurrency());
}

void ServerApp::RunWorkers() {
  const std::size_t thread_count = ThreadCount();
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // 남은 세션이 정리되며 진행 중인 게임이 판정되지 않도록 먼저 알린다.
  coordinator_->BeginShutdown();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_flag = [&get_env](const char* key, const char* def) {
    auto value = get_env(key, def);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !(value == "false" || value == "0" || value == "no" || value == "off");
  };

  AppConfig cfg;
  // PORT 가 우선이고, 없으면 SERVER_PORT, 둘 다 없으면 3001.
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("PORT", get_env("SERVER_PORT", "3001").c_str())));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.persistence_enabled = get_flag("PERSISTENCE_ENABLED", "true");
  cfg.snapshot_key = get_env("SNAPSHOT_KEY", "rooms");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.session_time_budget_seconds =
      static_cast<std::size_t>(std::stoul(get_env("SESSION_TIME_BUDGET_SECONDS", "300")));
  cfg.challenge_file = get_env("CHALLENGE_FILE", "");
  cfg.worker_threads = static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", "0")));
  return cfg;
}

}  // namespace codebattle
