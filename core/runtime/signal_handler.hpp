#pragma once

#include <atomic>

namespace hostlink {
namespace runtime {

// SIGINT/SIGTERM latch polled by the main loops of both executables
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Programmatic shutdown (e.g. from the daemon kill switch)
    static void request_shutdown();
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace hostlink
