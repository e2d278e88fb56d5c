/*
 * 설명: 브로커 전체 수명주기와 서비스 객체 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp, server/tests/e2e/stream_lifecycle_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "broker/config.hpp"
#include "broker/message_router.hpp"
#include "broker/observability.hpp"
#include "broker/session_registry.hpp"
#include "broker/stream_gateway.hpp"
#include "broker/token_store.hpp"

namespace broker {

class Listener;

TokenStoreConfig MakeTokenStoreConfig(const AppConfig& config);

class BrokerApp {
 public:
  explicit BrokerApp(const AppConfig& config);
  ~BrokerApp();

  // 리스너를 바인드하고 워커 스레드를 띄운 뒤 바로 돌아온다.
  void Start();
  // Start 후 SIGINT/SIGTERM을 받을 때까지 현재 스레드에서 io_context를 돌린다.
  void Run();
  void Stop();

  unsigned short BoundPort() const;
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<TokenStore> GetTokenStore() { return token_store_; }
  std::shared_ptr<SessionRegistry> GetSessionRegistry() { return registry_; }
  std::shared_ptr<MessageRouter> GetMessageRouter() { return router_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<TokenStore> token_store_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<StreamGateway> gateway_;
  std::shared_ptr<MessageRouter> router_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace broker
