// Copyright (c) 2025, WH, All rights reserved.
#include "Logging.h"

#ifdef SDL3BIND_PLATFORM_WINDOWS
#include <io.h>
#else
#include <unistd.h>
#endif

#include <SDL3/SDL_log.h>

// we want all logging to be output, so set it to the most verbose level
// otherwise, the SPDLOG_ macros below SPD_LOG_LEVEL_INFO will just do (void)0;
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#include "spdlog/common.h"
#include "spdlog/async_logger.h"

#include "spdlog/spdlog.h"
#include "spdlog/async.h"
#include "spdlog/details/file_helper.h"
#include "spdlog/sinks/base_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/pattern_formatter.h"

#include <memory>
#include <mutex>
#include <vector>

#define DEFAULT_LOGGER_NAME "main"
#define RAW_LOGGER_NAME "raw"

#ifdef SDL3BIND_DEBUG_BUILD
// debug pattern: [filename:line] [function]: message
#define FANCY_LOG_PATTERN "[%s:%#] [%!]: %v"
// for file output, add timestamp (and thread, for debug) info
#define FILE_LOG_PATTERN_PREF "[%T.%e] [th:%t]"
#else
// release pattern: [function] message
#define FANCY_LOG_PATTERN "[%!] %v"
// add HH:MM:SS timestamp
#define FILE_LOG_PATTERN_PREF "[%T]"
#endif

namespace Logger {
namespace {  // static
std::shared_ptr<spdlog::async_logger> g_logger;
std::shared_ptr<spdlog::async_logger> g_raw_logger;

bool s_sdl_log_installed{false};

// sharing one basic_file_sink between the two loggers doesn't give us per-logger patterns,
// so pick the formatter based on the logger name instead
class DualPatternFileSink final : public spdlog::sinks::base_sink<std::mutex> {
   private:
    spdlog::details::file_helper file_helper_;
    std::unique_ptr<spdlog::pattern_formatter> raw_formatter_{nullptr};

   public:
    explicit DualPatternFileSink(const spdlog::filename_t &filename, bool truncate = false) {
        // do both the prefix and the fancy log pattern
        base_sink::formatter_ =
            std::make_unique<spdlog::pattern_formatter>(FILE_LOG_PATTERN_PREF " " FANCY_LOG_PATTERN);
        // plain after the prefix
        raw_formatter_ = std::make_unique<spdlog::pattern_formatter>(FILE_LOG_PATTERN_PREF " %v");

        file_helper_.open(filename, truncate);
    }

   protected:
    inline void sink_it_(const spdlog::details::log_msg &msg) override {
        spdlog::memory_buf_t formatted;

        static_assert(RAW_LOGGER_NAME[0] == 'r');
        if(msg.logger_name.size() > 0 && msg.logger_name[0] == RAW_LOGGER_NAME[0]) {  // raw
            raw_formatter_->format(msg, formatted);
        } else {  // cooked
            base_sink::formatter_->format(msg, formatted);
        }

        file_helper_.write(formatted);
    }

    inline void flush_() override { file_helper_.flush(); }
};

static_assert(static_cast<int>(Level::critical) == spdlog::level::critical);

spdlog::level::level_enum toSpdlog(Level lvl) { return static_cast<spdlog::level::level_enum>(lvl); }

spdlog::level::level_enum sdlPriorityToLevel(SDL_LogPriority priority) {
    switch(priority) {
        case SDL_LOG_PRIORITY_TRACE:
        case SDL_LOG_PRIORITY_VERBOSE:
            return spdlog::level::trace;
        case SDL_LOG_PRIORITY_DEBUG:
            return spdlog::level::debug;
        case SDL_LOG_PRIORITY_WARN:
            return spdlog::level::warn;
        case SDL_LOG_PRIORITY_ERROR:
            return spdlog::level::err;
        case SDL_LOG_PRIORITY_CRITICAL:
            return spdlog::level::critical;
        default:
            return spdlog::level::info;
    }
}

void SDLCALL sdlLogOutput(void * /*userdata*/, int category, SDL_LogPriority priority, const char *message) {
    if(unlikely(!_detail::g_initialized)) {
        printf("[SDL:%d] %s\n", category, message);
        return;
    }
    g_raw_logger->log(sdlPriorityToLevel(priority), "[SDL:{}] {}", category, message);
}

}  // namespace

namespace _detail {
// global var defs
bool g_initialized{false};

void log_int(const Source &src, Level lvl, std::string_view str) noexcept {
    g_logger->log(spdlog::source_loc{src.file, src.line, src.func}, toSpdlog(lvl), str);
}

void logRaw_int(Level lvl, std::string_view str) noexcept { g_raw_logger->log(toSpdlog(lvl), str); }

}  // namespace _detail
using namespace _detail;

// to be called in main(), for one-time setup/teardown
void init(const char *logFile) noexcept {
    if(g_initialized) return;

    // make console output visible immediately
    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    // queue size: 8192 slots, 1 background thread
    spdlog::init_thread_pool(8192, 1);

#ifdef SDL3BIND_PLATFORM_WINDOWS
    using mt_stdout_sink_t = spdlog::sinks::wincolor_stdout_sink_mt;
#else
    using mt_stdout_sink_t = spdlog::sinks::ansicolor_stdout_sink_mt;
#endif
    auto stdout_sink{std::make_shared<mt_stdout_sink_t>()};
    stdout_sink->set_pattern(FANCY_LOG_PATTERN);

    // unformatted stdout sink
    auto raw_stdout_sink{std::make_shared<mt_stdout_sink_t>()};
    raw_stdout_sink->set_pattern("%v");  // just the message

    std::vector<spdlog::sink_ptr> main_sinks{std::move(stdout_sink)};
    std::vector<spdlog::sink_ptr> raw_sinks{std::move(raw_stdout_sink)};

    if(logFile != nullptr && *logFile != '\0') {
        try {
            auto file_sink{std::make_shared<DualPatternFileSink>(logFile, true /* overwrite */)};
            main_sinks.push_back(file_sink);
            raw_sinks.push_back(file_sink);
        } catch(const spdlog::spdlog_ex &e) {
            printf("couldn't open log file %s: %s\n", logFile, e.what());
        }
    }

    g_logger =
        std::make_shared<spdlog::async_logger>(DEFAULT_LOGGER_NAME, main_sinks.begin(), main_sinks.end(),
                                               spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    g_raw_logger =
        std::make_shared<spdlog::async_logger>(RAW_LOGGER_NAME, raw_sinks.begin(), raw_sinks.end(),
                                               spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);

    g_logger->set_level(spdlog::level::trace);
    g_raw_logger->set_level(spdlog::level::trace);

    // warnings and up get flushed right away, the rest goes out with the periodic flush
    g_logger->flush_on(spdlog::level::warn);
    g_raw_logger->flush_on(spdlog::level::warn);

    spdlog::register_logger(g_logger);
    spdlog::register_logger(g_raw_logger);

    spdlog::flush_every(std::chrono::milliseconds(500));
    spdlog::set_default_logger(g_logger);

    g_initialized = true;
}

// spdlog::shutdown() explodes if its called at program exit (by global atexit handler), so we need to manually shut it down
void shutdown() noexcept {
    if(!g_initialized) return;
    flush();

    if(s_sdl_log_installed) {
        SDL_SetLogOutputFunction(SDL_GetDefaultLogOutputFunction(), nullptr);
        s_sdl_log_installed = false;
    }

    g_initialized = false;

    g_raw_logger.reset();
    g_logger.reset();

    // for async loggers, this waits for the background thread to finish processing queued messages
    spdlog::shutdown();
}

void flush() noexcept {
    if(likely(g_initialized)) {
        g_logger->flush();
        g_raw_logger->flush();
    } else {
        fflush(stdout);
        fflush(stderr);
    }
}

bool isaTTY() noexcept {
    static const bool tty_status{isatty(fileno(stdout)) != 0};
    return tty_status;
}

void installSdlLogOutput() noexcept {
    SDL_SetLogOutputFunction(sdlLogOutput, nullptr);
    s_sdl_log_installed = true;
}

}  // namespace Logger
