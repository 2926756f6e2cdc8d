#pragma once

#include "shed/config.hpp"
#include "shed/net/echo_server.hpp"

#include <chrono>
#include <memory>

namespace shed {

/// shed-server entry point and lifecycle management.
/// Parses configuration, starts the line echo server, and drives its event
/// loop until SIGINT/SIGTERM.
class App {
  public:
    static constexpr std::chrono::milliseconds kPollInterval{100};

    App();
    ~App();

    /// Run the main application loop.
    /// Returns exit code (0 = success).
    int run(int argc, char *argv[]);

    /// Ask the running loop to exit. Async-signal-safe.
    static void request_stop();

  private:
    void install_signal_handlers();
    void run_loop();

    std::unique_ptr<net::LineEchoServer> server_;
    ServerConfig config_;
};

} // namespace shed
