#include <gflags/gflags.h>
#include <pthread.h>

#include <boost/system/system_error.hpp>

#include <csignal>
#include <iostream>
#include <string>

#include "Api/ApiRouter.hpp"
#include "Api/HttpServer.hpp"
#include "Config/ServerConfig.hpp"
#include "TaskManager/TaskManager.hpp"
#include "TaskManager/errors.hpp"
#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"
#include "utils/timer.hpp"

namespace {

void reportActiveTasks(const streamcap::TaskManager& manager,
                       const std::string& arenaName) {
  auto tasks = manager.getActiveTasks();
  if (tasks.empty()) return;
  uint64_t total = 0;
  for (const auto& task : tasks) total += task.bytesWritten;
  auto& tbb = utils::TBBManager::GetInstance();
  LOG(INFO) << "Active captures: " << tasks.size() << ", " << total
            << " bytes written, arena " << arenaName << " in flight "
            << tbb.InFlight(arenaName) << " (concurrency "
            << tbb.Concurrency(arenaName) << ")";
  for (const auto& task : tasks) {
    LOG(DEBUG) << "  " << task.id << " " << task.fileName << " "
               << task.bytesWritten << " bytes";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("Live stream capture server");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  streamcap::ServerConfig cfg;
  try {
    cfg = streamcap::LoadServerConfigFromFlags();
  } catch (const streamcap::InvalidArgument& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  utils::Logger::initialize(cfg.log);

  // 在创建任何线程之前屏蔽信号，由主线程 sigwait 统一处理
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  std::signal(SIGPIPE, SIG_IGN);

  try {
    streamcap::TaskManager manager(cfg.manager);
    streamcap::ApiRouter router(manager);
    streamcap::HttpServer server(router, cfg.address, cfg.port,
                                 cfg.requestTimeout);
    server.start();

    LOG(INFO) << "Data directory: " << cfg.dataDir;

    utils::Timer timer;
    if (cfg.progressReportSec > 0) {
      auto period = std::chrono::seconds(cfg.progressReportSec);
      timer.addPeriodicTask(
          std::chrono::duration_cast<std::chrono::milliseconds>(period),
          std::chrono::duration_cast<std::chrono::milliseconds>(period),
          [&manager, &cfg]() {
            reportActiveTasks(manager, cfg.manager.arenaName);
          });
      timer.start();
    }

    int sig = 0;
    sigwait(&signals, &sig);
    LOG(INFO) << "Received signal " << sig << ", shutting down";

    timer.stop();
    server.stop();
    manager.shutdown();
  } catch (const streamcap::CaptureError& e) {
    LOG(FATAL) << "Startup failed: " << e.what();
    return 1;
  } catch (const boost::system::system_error& e) {
    LOG(FATAL) << "HTTP server failed: " << e.what();
    return 1;
  }

  utils::TBBManager::GetInstance().Release();
  gflags::ShutDownCommandLineFlags();
  return 0;
}
