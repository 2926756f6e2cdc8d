#include "shed/app.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <exception>
#include <string>

namespace shed {

namespace {

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int /*signum*/) { App::request_stop(); }

} // namespace

App::App() = default;
App::~App() = default;

void App::request_stop() { g_stop_requested.store(true, std::memory_order_relaxed); }

void App::install_signal_handlers() {
    g_stop_requested.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: poll() returns EINTR so the loop notices the flag promptly.
    action.sa_flags = 0;
    for (int signum : {SIGINT, SIGTERM}) {
        if (sigaction(signum, &action, nullptr) != 0) {
            std::fprintf(stderr, "[shed] Warning: cannot install handler for signal %d\n", signum);
        }
    }
}

int App::run(int argc, char *argv[]) {
    const std::string program = argc > 0 ? argv[0] : "shed-server";

    try {
        auto cmd = parse_command_line(argc, argv);
        if (cmd.show_help) {
            std::printf("%s", usage(program).c_str());
            return 0;
        }
        config_ = cmd.config;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[shed] Error: %s\n%s", e.what(), usage(program).c_str());
        return 2;
    }

    install_signal_handlers();

    try {
        server_ = std::make_unique<net::LineEchoServer>(config_.max_log_entries);
        server_->log().set_mirror(!config_.quiet);
        server_->set_echo(config_.echo_lines);
        server_->start(config_.port, config_.bind_address);

        run_loop();

        server_->stop();
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[shed] Error: %s\n", e.what());
        if (server_) {
            server_->stop();
        }
        return 1;
    }

    std::printf("[shed] Shutdown complete\n");
    return 0;
}

void App::run_loop() {
    std::printf("[shed] Server running on port %u (Ctrl+C to stop)\n",
                static_cast<unsigned>(server_->port()));
    std::fflush(stdout);

    while (!g_stop_requested.load(std::memory_order_relaxed)) {
        server_->poll(kPollInterval);
    }
}

} // namespace shed
