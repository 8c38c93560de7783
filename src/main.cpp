#include "callguard/app.hpp"
#include "callguard/config.hpp"
#include "callguard/logging.hpp"

#include <csignal>
#include <pthread.h>
#include <string>
#include <thread>

int main() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        const auto config = callguard::Config::load();
        config.validate();
        callguard::logging::init(config);
        callguard::info(
            "Starting callguard",
            {callguard::kv("store", config.store_path),
             callguard::kv("rest_port", config.rest_api_port),
             callguard::kv("upload_workers", config.upload_workers),
             callguard::kv("escalation_rules", config.escalation_rules.size())});
        callguard::CallguardApp app(config);
        app.init();

        std::thread signal_waiter([&app, signals]() {
            int received = 0;
            sigwait(&signals, &received);
            callguard::info("Shutdown requested", {callguard::kv("signal", received)});
            app.stop();
        });
        app.run();
        signal_waiter.join();
    } catch (const std::exception& ex) {
        callguard::error(
            "Startup failed",
            {callguard::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
