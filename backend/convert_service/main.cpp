#include "application/task_orchestrator.hpp"
#include "application/task_registry.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/ffmpeg_engine.hpp"
#include "infrastructure/libav_media_probe.hpp"
#include "infrastructure/local_file_catalog.hpp"
#include "interface/rest_api_handler.hpp"
#include <boost/asio.hpp>
#include <iostream>
#include <thread>
#include <vector>

namespace {

// Drops finished tasks once they outlive the retention window.
class RegistrySweeper {
public:
  RegistrySweeper(boost::asio::io_context& ioc,
                  std::shared_ptr<convert_service::TaskRegistry> registry,
                  const config::SchedulerConfig& config)
    : timer_(ioc), registry_(std::move(registry)),
      interval_(config.sweep_interval), retention_(config.task_retention) {}

  void start() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      registry_->evictExpired(std::chrono::steady_clock::now(), retention_);
      start();
    });
  }

  void stop() { timer_.cancel(); }

private:
  boost::asio::steady_timer timer_;
  std::shared_ptr<convert_service::TaskRegistry> registry_;
  std::chrono::seconds interval_;
  std::chrono::seconds retention_;
};

} // namespace

int main(int argc, char** argv) {
  try {
    const auto& cfg = config::Config::getInstance();
    const auto& http_config = cfg.getHttp();

    auto catalog = std::make_shared<convert_service::LocalFileCatalog>(cfg.getStorage());
    if (auto created = catalog->ensureRoots(); !created) {
      std::cerr << "Error: " << created.error().message << std::endl;
      return 1;
    }

    auto engine = std::make_shared<convert_service::FfmpegEngine>(cfg.getEngine());
    if (auto binary = engine->locateBinary(); binary) {
      std::cout << "[main] using " << binary->string() << std::endl;
    } else {
      // not fatal: every job fails with SpawnError until ffmpeg is installed
      std::cerr << "[main] " << binary.error().message << std::endl;
    }

    auto probe = std::make_shared<convert_service::LibavMediaProbe>(cfg.getEngine().av_log_level);
    auto registry = std::make_shared<convert_service::TaskRegistry>();
    auto orchestrator = std::make_shared<convert_service::TaskOrchestrator>(
      registry, catalog, probe, engine, cfg.getScheduler());

    boost::asio::io_context ioc{http_config.io_threads};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_config.host), http_config.port};

    auto api_handler = std::make_shared<convert_service::RestApiHandler>(registry, orchestrator, catalog);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};
    RegistrySweeper sweeper{ioc, registry, cfg.getScheduler()};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
      if (ec) {
        return;
      }
      std::cout << "[main] signal " << signal << ", shutting down" << std::endl;
      http_server.stop();
      sweeper.stop();
      // engine processes must not outlive the service
      orchestrator->shutdown();
      ioc.stop();
    });

    http_server.run();
    sweeper.start();
    std::cout << "HTTP Server listening on " << cfg.getHttpIpPort()
              << ", storage under " << cfg.getBaseDir() << std::endl;

    std::vector<std::thread> io_threads;
    for (int i = 1; i < http_config.io_threads; ++i) {
      io_threads.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();

    for (auto& thread : io_threads) {
      thread.join();
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
