#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace healer::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    const char* levelName(LogLevel l);
    std::optional<LogLevel> parseLevel(std::string_view name);

    struct LogRecord
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "Recovery", "CandidateEngine"
        std::string msg;

        // Optional structured fields:
        std::string file;          // torrent-relative path
        std::string candidate;     // candidate label, e.g. "gzip -9 -n"
        std::string outcome;       // "recovered|gzipped|skipped|missing"
        int64_t     bytes{-1};
        int64_t     piece{-1};
    };

    // Renders "<ts> [LEVEL] logger: msg key=value..." without a trailing newline.
    std::string renderLine(const LogRecord& rec);

    class ILoggerSink
    {
    public:
        virtual ~ILoggerSink() = default;
        virtual void write(const LogRecord& rec) = 0;
    };

    class StdoutSink : public ILoggerSink
    {
    public:
        void write(const LogRecord& rec) override;
    };

    // Keeps stdout free for machine-readable output.
    class StderrSink : public ILoggerSink
    {
    public:
        void write(const LogRecord& rec) override;
    };

    class FileSink : public ILoggerSink
    {
    public:
        explicit FileSink(const std::string& path);
        bool isOpen() const { return out_.is_open(); }
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    class Logger
    {
    public:
        explicit Logger(std::shared_ptr<ILoggerSink> sink = std::make_shared<StdoutSink>())
        : sink_(std::move(sink)) {}

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }

        bool enabled(LogLevel lvl) const {
            return lvl != LogLevel::none && static_cast<unsigned>(lvl) >= static_cast<unsigned>(level());
        }

        void log(LogRecord rec) {
            if (!enabled(rec.level)) return;
            rec.ts = std::chrono::system_clock::now();
            std::scoped_lock lk(mu_);
            sink_->write(rec);
        }

        void trace(std::string msg, std::string logger = {}) { emit(LogLevel::trace, std::move(msg), std::move(logger)); }
        void debug(std::string msg, std::string logger = {}) { emit(LogLevel::debug, std::move(msg), std::move(logger)); }
        void info (std::string msg, std::string logger = {}) { emit(LogLevel::info , std::move(msg), std::move(logger)); }
        void warn (std::string msg, std::string logger = {}) { emit(LogLevel::warn , std::move(msg), std::move(logger)); }
        void error(std::string msg, std::string logger = {}) { emit(LogLevel::error, std::move(msg), std::move(logger)); }

    private:
        void emit(LogLevel lvl, std::string msg, std::string logger) {
            LogRecord rec;
            rec.level = lvl;
            rec.msg   = std::move(msg);
            rec.logger= std::move(logger);
            log(std::move(rec));
        }

        std::mutex mu_;
        std::shared_ptr<ILoggerSink> sink_;
        std::atomic<LogLevel> level_{LogLevel::info};
    };

    // Compile-time floor; records below it are never built.
    #ifndef TH_LOG_LEVEL
    #define TH_LOG_LEVEL healer::logger::LogLevel::debug
    #endif

    #define TH_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(TH_LOG_LEVEL))

    // Usage: TH_LOG(loggerPtr, LogLevel::info, "Recovery") << "message " << x;
    // Records with structured fields are built by hand and passed to Logger::log.
    #define TH_LOG(LOGGER_PTR, LVL, NAME) \
        if (!(LOGGER_PTR) || !TH_LOG_ENABLED(LVL) || !(LOGGER_PTR)->enabled(LVL)) ; \
        else ::healer::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), (NAME), __func__, __LINE__).stream()

    namespace detail {
        class LogStreamHelper
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, std::string name, const char* fn, int line)
            : lg_(lg) {
                rec_.level = lvl;
                rec_.logger = std::move(name);
                if (lvl <= LogLevel::debug) ss_ << "[" << fn << ":" << line << "] ";
            }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
        private:
            Logger& lg_;
            LogRecord rec_;
            std::ostringstream ss_;
        };
    }

} // namespace healer::logger
