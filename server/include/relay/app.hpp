/*
 * 설명: 시그널링 서버 전체 수명주기를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/signaling_e2e_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "relay/config.hpp"
#include "relay/observability.hpp"
#include "relay/realtime.hpp"
#include "relay/signaling_router.hpp"

namespace relay {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 포트를 바인딩하고 실제 포트를 반환한다. config.port가 0이면 임의 포트가 할당된다.
  unsigned short Listen();
  void Run();
  // 여러 번 호출되어도 안전하며 run() 전에 호출되면 run()은 즉시 반환된다.
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SignalingRouter> GetRouter() { return router_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void JoinWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<SignalingRouter> router_;
  std::vector<std::thread> workers_;
};

}  // namespace relay
