/*
 * 설명: 브로커 수명주기, 리스너, 워커 스레드, 종료 신호 처리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp, server/tests/e2e/stream_lifecycle_test.cpp
 */
#include "broker/app.hpp"

#include <chrono>
#include <csignal>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "broker/http_session.hpp"
#include "broker/token_codec.hpp"

namespace broker {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           const AppConfig& config, std::shared_ptr<TokenStore> token_store,
           std::shared_ptr<SessionRegistry> registry, std::shared_ptr<StreamGateway> gateway,
           std::shared_ptr<MessageRouter> router, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), token_store_(std::move(token_store)),
        registry_(std::move(registry)), gateway_(std::move(gateway)), router_(std::move(router)),
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
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short LocalPort() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket),
                                          self->config_,
                                          self->token_store_,
                                          self->registry_,
                                          self->gateway_,
                                          self->router_,
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
  std::shared_ptr<TokenStore> token_store_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<StreamGateway> gateway_;
  std::shared_ptr<MessageRouter> router_;
  std::shared_ptr<Observability> observability_;
};

TokenStoreConfig MakeTokenStoreConfig(const AppConfig& config) {
  TokenStoreConfig store_config;
  store_config.legacy_fallback_enabled = config.legacy_fallback_enabled;
  store_config.fallback_tokens = config.legacy_fallback_tokens;
  store_config.token_ttl = std::chrono::seconds(config.token_ttl_seconds);
  return store_config;
}

BrokerApp::BrokerApp(const AppConfig& config)
    : config_(config), ioc_(static_cast<int>(config.worker_threads)), work_guard_(boost::asio::make_work_guard(ioc_)),
      signals_(ioc_, SIGINT, SIGTERM) {
  if (!IsValidUsername(config_.test_token_user)) {
    throw std::invalid_argument("TEST_TOKEN_USER는 비어 있거나 ':'를 포함할 수 없습니다");
  }
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  token_store_ = std::make_shared<TokenStore>(MakeTokenStoreConfig(config_));
  token_store_->SetObservability(observability_);
  registry_ = std::make_shared<SessionRegistry>();
  registry_->SetObservability(observability_);
  gateway_ = std::make_shared<StreamGateway>(token_store_, registry_, observability_);
  router_ = std::make_shared<MessageRouter>(registry_, observability_);
}

BrokerApp::~BrokerApp() {
  Stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void BrokerApp::Start() {
  if (running_.exchange(true)) {
    return;
  }
  auto address = boost::asio::ip::make_address(config_.bind_address);
  boost::asio::ip::tcp::endpoint endpoint{address, config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, token_store_, registry_, gateway_, router_,
                                         observability_);
  listener_->Run();

  LogContext ctx;
  ctx.name = "broker.start";
  ctx.detail = {{"port", BoundPort()},
                {"workers", config_.worker_threads},
                {"legacyFallback", config_.legacy_fallback_enabled},
                {"authService", config_.auth_service_url}};
  observability_->Log(ctx);
  if (config_.legacy_fallback_enabled) {
    LogContext warn;
    warn.name = "broker.legacy_fallback_enabled";
    warn.level = LogLevel::kWarn;
    warn.detail = {{"entries", config_.legacy_fallback_tokens.size()}};
    observability_->Log(warn);
  }

  for (std::size_t i = 0; i < config_.worker_threads; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void BrokerApp::Run() {
  Start();
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    LogContext ctx;
    ctx.name = "broker.signal";
    ctx.detail = {{"signal", signal_number}};
    observability_->Log(ctx);
    Stop();
  });
  ioc_.run();
  Stop();
}

void BrokerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (listener_) {
    listener_->Stop();
  }
  auto closed = registry_->EvictAll();
  boost::system::error_code ec;
  signals_.cancel(ec);
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    // 신호 처리기는 워커 스레드에서 돌 수 있으므로 자기 자신은 소멸자에서 join한다.
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
  LogContext ctx;
  ctx.name = "broker.stop";
  ctx.detail = {{"closedStreams", closed}};
  observability_->Log(ctx);
}

unsigned short BrokerApp::BoundPort() const { return listener_ ? listener_->LocalPort() : 0; }

}  // namespace broker
