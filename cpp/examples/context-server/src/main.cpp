#include <ctxsync/error.hpp>
#include <ctxsync/server.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::function<void()> shutdownHandler;

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
  auto onSignal = [](int) {
    if (shutdownHandler) {
      shutdownHandler();
    }
  };
  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  auto optionsResult = ctxsync::ContextServerOptions::fromEnvironment();
  if (!optionsResult.has_value()) {
    std::cerr << "Invalid configuration: " << ctxsync::strerror(optionsResult.error()) << '\n';
    return 1;
  }

  auto serverResult = ctxsync::ContextServer::create(std::move(optionsResult.value()));
  if (!serverResult.has_value()) {
    std::cerr << "Failed to create server: " << ctxsync::strerror(serverResult.error()) << '\n';
    return 1;
  }
  auto server = std::move(serverResult.value());
  std::cerr << "Server listening on port " << server.port() << '\n';

  std::atomic_bool done = false;
  shutdownHandler = [&] {
    done = true;
  };

  auto lastReport = std::chrono::steady_clock::now();
  while (!done) {
    std::this_thread::sleep_for(100ms);
    if (std::chrono::steady_clock::now() - lastReport < 60s) {
      continue;
    }
    lastReport = std::chrono::steady_clock::now();
    auto status = server.status();
    ctxsync::info() << status.connected_sessions << " sessions, " << status.entry_count
                     << " entries, " << status.total_tokens << "/" << status.max_tokens
                     << " tokens";
  }

  std::cerr << "Shutting down...\n";
  server.stop();
  std::cerr << "Done\n";
  return 0;
}
