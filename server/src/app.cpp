/*
 * 설명: 서버 수명주기, 리스닝 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#include "fanout/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "fanout/db_client.hpp"
#include "fanout/http_session.hpp"
#include "fanout/in_memory_store.hpp"
#include "fanout/mariadb_store.hpp"

namespace fanout {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<EventRouter> router,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), coordinator_(std::move(coordinator)),
        router_(std::move(router)), observability_(std::move(observability)) {
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
    // 소켓마다 별도 strand를 두어 한 연결의 이벤트는 순서대로 처리된다.
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->coordinator_, self->router_,
                                          self->observability_)
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
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<EventRouter> router_;
  std::shared_ptr<Observability> observability_;
};

std::shared_ptr<SocialStore> MakeStore(const AppConfig& config) {
  if (config.store_backend == "memory") {
    return std::make_shared<InMemorySocialStore>();
  }
  if (config.store_backend == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    return std::make_shared<MariaDbSocialStore>(std::make_shared<MariaDbClient>(db_config));
  }
  throw std::invalid_argument("알 수 없는 STORE_BACKEND: " + config.store_backend);
}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<SocialStore> store)
    : config_(config),
      ioc_(static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))),
      work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  store_ = store ? std::move(store) : MakeStore(config);
  registry_ = std::make_shared<ConnectionRegistry>();
  coordinator_ = std::make_shared<RealtimeCoordinator>();
  coordinator_->SetObservability(observability_);
  broadcaster_ = std::make_shared<PresenceBroadcaster>(registry_, store_, coordinator_, observability_);
  presence_ = std::make_shared<PresenceService>(registry_, store_, broadcaster_, observability_);
  relay_ = std::make_shared<MessageRelay>(registry_, store_, coordinator_, observability_);
  reactions_ = std::make_shared<ReactionAggregator>(store_, coordinator_, observability_);
  updates_ = std::make_shared<UpdatePublisher>(store_, coordinator_, observability_);
  router_ = std::make_shared<EventRouter>(coordinator_, presence_, relay_, reactions_, updates_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, router_, observability_);
    listener_->Run();
    observability_->Info("server.started",
                         "port=" + std::to_string(config_.port) + " store=" + config_.store_backend);
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Error("server.run_failed", ex.what());
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
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

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.store_backend = get_env("STORE_BACKEND", "mariadb");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

}  // namespace fanout
