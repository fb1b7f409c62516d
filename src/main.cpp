#include "config.hpp"
#include "server.hpp"

#include <rtc/rtc.hpp>

#include <csignal>
#include <exception>
#include <iostream>

#include <pthread.h>

int main(int argc, char** argv) {
    try {
        shareflow::RelayConfig config;
        if (argc > 1) {
            config = shareflow::LoadConfig(argv[1]);
        }
        shareflow::ApplyEnvironment(config);

        rtc::InitLogger(shareflow::ParseLogLevel(config.logLevel));

        // Signals are consumed by sigwait below, not by the worker threads.
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        shareflow::RelayServer server(config);
        server.Start();

        int received = 0;
        sigwait(&signals, &received);
        std::cout << "[Relay] Received signal " << received << ", shutting down" << std::endl;

        server.Stop();
    } catch (const std::exception& e) {
        std::cerr << "[Relay] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
