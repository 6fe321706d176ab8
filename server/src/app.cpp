/*
 * 설명: 서버 수명주기와 리스닝/워커 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/signaling_e2e_test.cpp
 */
#include "relay/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "relay/http_session.hpp"

namespace relay {
namespace {
std::size_t ResolveThreadCount(const AppConfig& config) {
  if (config.worker_threads > 0) {
    return config.worker_threads;
  }
  return std::max(1u, std::thread::hardware_concurrency());
}
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<SignalingRouter> router,
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
  std::shared_ptr<SignalingRouter> router_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(static_cast<int>(ResolveThreadCount(config))),
      work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  coordinator_ = std::make_shared<RealtimeCoordinator>();
  coordinator_->SetObservability(observability_);
  router_ = std::make_shared<SignalingRouter>(coordinator_, observability_);
}

ServerApp::~ServerApp() {
  Stop();
  JoinWorkers();
}

unsigned short ServerApp::Listen() {
  if (!listener_) {
    auto address = boost::asio::ip::make_address(config_.address);
    boost::asio::ip::tcp::endpoint endpoint{address, config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, router_, observability_);
  }
  return listener_->LocalPort();
}

void ServerApp::Run() {
  try {
    auto port = Listen();
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "시그널 " << signal_number << " 수신, 종료를 준비합니다\n";
      Stop();
    });
    std::cout << "서버 시작: 포트 " << port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
  JoinWorkers();
}

void ServerApp::RunWorkers() {
  const std::size_t thread_count = ResolveThreadCount(config_);
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

void ServerApp::Stop() {
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.address = get_env("SERVER_ADDRESS", "0.0.0.0");
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8000")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.worker_threads = static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", "0")));
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "512")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "8388608")));
  cfg.ws_max_message_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_MAX_MESSAGE_BYTES", "4194304")));
  return cfg;
}

}  // namespace relay
