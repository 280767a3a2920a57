#pragma once

#include <atomic>
#include <string>

namespace hearth {
namespace runtime {

/**
 * @brief Shutdown request raised by SIGINT / SIGTERM.
 *
 * The event loop polls is_shutdown_requested() between receives; the
 * handler itself only stores the signal number.
 */
class SignalHandler {
public:
    // false with a description in error if a handler could not be registered
    static bool install(std::string &error);

    static bool is_shutdown_requested();

    // Number of the signal that requested shutdown, 0 if none
    static int last_signal();

    // "SIGINT", "SIGTERM" or "signal N"
    static std::string signal_name(int signal);

    // Clears the request (tests)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace hearth
