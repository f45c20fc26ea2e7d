#ifndef RESPKV_UTIL_SIGNAL_HANDLER_HPP
#define RESPKV_UTIL_SIGNAL_HANDLER_HPP

#include <atomic>

namespace respkv::util {

class SignalHandler {
   public:
    // SIGINT/SIGTERM request shutdown, SIGPIPE is ignored
    static void install();
    static bool should_shutdown();
    static void wait_for_shutdown();
    static void request_shutdown();
    static void reset();

   private:
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace respkv::util

#endif
