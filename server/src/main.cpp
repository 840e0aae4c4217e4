#include "Logger.h"
#include "ParleyServer.h"
#include "ServerConfig.h"
#include "../../Version.h"
#include <asio.hpp>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <csignal>

// Re-arm after each delivery so a second Ctrl+C during a slow drain is still
// handled here instead of by the default handler.
static void ArmSignals(asio::signal_set& signals, asio::io_context& io_context) {
    signals.async_wait([&signals, &io_context](const std::error_code& ec, int signo) {
        if (ec) return;
        Parley::VoiceTrace::log("step=server_shutdown status=graceful signal="
            + std::to_string(signo));
        io_context.stop();
        ArmSignals(signals, io_context);
        });
}

int main(int argc, char* argv[]) {
    std::string configPath = "parley-server.json";
    if (const char* env = std::getenv("PARLEY_CONFIG"); env && env[0]) configPath = env;
    if (argc > 1) configPath = argv[1];

    try {
        Parley::ServerConfig config = Parley::ServerConfig::Load(configPath);
        config.ApplyEnvironment();
        Parley::VoiceTrace::init(config.voiceTracePath, config.voiceTrace);

        asio::io_context io_context;
        Parley::ParleyServer server(io_context, config);

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        ArmSignals(signals, io_context);

        // I/O bound; more threads than this only add lock contention.
        constexpr unsigned int kMaxThreads = 16u;
        unsigned int thread_count = config.threads;
        if (thread_count == 0) thread_count = std::thread::hardware_concurrency();
        if (thread_count == 0) thread_count = 4;
        thread_count = std::min(thread_count, kMaxThreads);

        std::cout << "Parley Server " << PARLEY_VERSION_STRING << " running on "
            << config.controlPort << "/" << config.voicePort << " with "
            << thread_count << " threads...\n";

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (unsigned int i = 0; i < thread_count; ++i)
            threads.emplace_back([&io_context] { io_context.run(); });
        for (auto& t : threads) t.join();
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
