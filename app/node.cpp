#include "NodeServer.h"
#include "Logger.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace {
std::atomic<bool> g_running{ true };
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}
} // namespace

int main(int argc, char **argv) {
  CLI::App app{ "sy-ledger node: proof-of-work ledger with an HTTP API" };

  std::string workDir;
  uint16_t port = 0;
  uint32_t difficulty = 0;
  std::vector<std::string> peers;

  app.add_option("-d,--work-dir", workDir,
                 "Work directory holding config.json and node.log")
      ->required();
  auto *portOption =
      app.add_option("--port", port, "HTTP port, overrides config.json")
          ->check(CLI::Range(1, 65535));
  auto *difficultyOption =
      app.add_option("--difficulty", difficulty,
                     "Leading zero hex digits required of block hashes")
          ->check(CLI::Range(0, 64));
  app.add_option("--peer", peers, "Peer address (host:port), repeatable");
  CLI11_PARSE(app, argc, argv);

  auto logger = sy::logging::getLogger("sy-node");
  logger.info << "sy-ledger node starting, work directory: " << workDir;

  sy::NodeServer::Overrides overrides;
  if (*portOption) {
    overrides.port = port;
  }
  if (*difficultyOption) {
    overrides.difficulty = difficulty;
  }
  overrides.peers = peers;

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  sy::NodeServer server;
  auto started = server.start(workDir, overrides);
  if (!started) {
    logger.error << "Failed to start node: " << started.error().message;
    std::cerr << "Error: " << started.error().message << "\n";
    return 1;
  }

  std::cout << "Node listening on port " << server.getPort() << "\n";
  std::cout << "Press Ctrl+C to stop the node...\n";

  std::unique_lock<std::mutex> lock(g_mutex);
  g_cv.wait(lock, [] { return !g_running.load(); });

  server.stop();
  logger.info << "Node stopped";
  return 0;
}
