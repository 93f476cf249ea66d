#ifndef PDR_DEBUG_CONSOLE_SINK_HPP
#define PDR_DEBUG_CONSOLE_SINK_HPP

#include <spdlog/sinks/base_sink.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/details/null_mutex.h>
#include <spdlog/formatter.h>
#include <cstdio>
#include <functional>
#include <mutex>

namespace PDR {

// DebugConsoleSink: forwards spdlog messages character by character to a
// putc-style console function, the only output a protection domain has.
// Thread safety is provided by the Mutex template parameter (default: std::mutex)
template<typename Mutex = std::mutex>
class DebugConsoleSink : public spdlog::sinks::base_sink<Mutex> {
public:
    using PutcFn = std::function<void(char)>;

    // Default console writes to stderr
    explicit DebugConsoleSink(PutcFn putc = [](char c) { std::fputc(c, stderr); })
        : putc_(std::move(putc)) {}

    // Prevent copying/moving
    DebugConsoleSink(const DebugConsoleSink&) = delete;
    DebugConsoleSink& operator=(const DebugConsoleSink&) = delete;

protected:
    // Called by spdlog for each log record
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted_buf;
        spdlog::sinks::base_sink<Mutex>::formatter_->format(msg, formatted_buf);
        for (char c : formatted_buf) {
            putc_(c);
        }
    }

    void flush_() override {
        // The debug console is unbuffered
    }

private:
    PutcFn putc_;
};

// Type aliases for common usage
using debug_console_sink_mt = DebugConsoleSink<std::mutex>;
using debug_console_sink_st = DebugConsoleSink<spdlog::details::null_mutex>;

} // namespace PDR

#endif // PDR_DEBUG_CONSOLE_SINK_HPP
