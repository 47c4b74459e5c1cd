#include "gigastream/app.hpp"
#include "gigastream/config.hpp"
#include "gigastream/logging.hpp"

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <string>
#include <thread>

namespace {

// Waits for SIGINT/SIGTERM on a dedicated thread and stops the app. The
// signals must already be blocked in every thread.
class SignalWatcher {
public:
    SignalWatcher(gigastream::App& app, const sigset_t& signals)
        : signals_(signals),
          thread_([this, &app]() {
              int signal_number = 0;
              if (sigwait(&signals_, &signal_number) != 0) {
                  gigastream::error("sigwait failed");
                  return;
              }
              if (!released_) {
                  gigastream::info(
                      "Shutdown signal received",
                      {gigastream::kv("signal", signal_number)});
              }
              app.stop();
          }) {}

    ~SignalWatcher() {
        released_ = true;
        pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

private:
    sigset_t signals_;
    std::atomic<bool> released_{false};
    std::thread thread_;
};

}

int main() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        const auto config = gigastream::Config::load();
        config.validate();
        gigastream::logging::init(config);
        gigastream::info(
            "Starting gigastream",
            {gigastream::kv("rest_port", config.rest_api_port),
             gigastream::kv("device", config.device),
             gigastream::kv("use_vad", config.use_vad),
             gigastream::kv("sample_rate", config.sample_rate)});
        gigastream::App app(config);
        SignalWatcher watcher(app, signals);
        app.init();
        app.run();
    } catch (const std::exception& ex) {
        gigastream::error(
            "Startup failed",
            {gigastream::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
