#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "core/agent.hpp"
#include "core/cancellation.hpp"
#include "core/config.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/agent.yaml";

  glonax_agent::core::AgentConfig config{};
  try {
    config = glonax_agent::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << glonax_agent::core::format_config_settings(config, config_path) << '\n';

  glonax_agent::core::CancellationToken token;
  std::thread signal_watch([&token] {
    while (g_shutdown_requested == 0 && !token.wait_for(std::chrono::milliseconds(100))) {
    }
    token.cancel();
  });

  {
    glonax_agent::core::Agent agent{config};
    agent.run(token);
  }

  token.cancel();
  signal_watch.join();

  std::cerr << "[agent] shutdown signal received; exiting cleanly\n";

  return 0;
}
