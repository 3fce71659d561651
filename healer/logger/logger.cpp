// logger.cpp
#include "logger.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <syncstream>

namespace healer::logger {

    const char* levelName(LogLevel l) {
        switch (l) {
            case LogLevel::trace: return "TRACE";
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info:  return "INFO";
            case LogLevel::warn:  return "WARN";
            case LogLevel::error: return "ERROR";
            default:              return "NONE";
        }
    }

    std::optional<LogLevel> parseLevel(std::string_view name) {
        std::string lower;
        for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

        if (lower == "trace") return LogLevel::trace;
        if (lower == "debug") return LogLevel::debug;
        if (lower == "info")  return LogLevel::info;
        if (lower == "warn" || lower == "warning") return LogLevel::warn;
        if (lower == "error") return LogLevel::error;
        if (lower == "none")  return LogLevel::none;
        return std::nullopt;
    }

    static std::string tsIso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string renderLine(const LogRecord& rec) {
        std::ostringstream out;
        out << tsIso8601(rec.ts) << " [" << levelName(rec.level) << "] "
            << (rec.logger.empty() ? "healer" : rec.logger) << ": "
            << rec.msg;

        if (!rec.file.empty())      out << " file="      << rec.file;
        if (!rec.candidate.empty()) out << " candidate=\"" << rec.candidate << '"';
        if (!rec.outcome.empty())   out << " outcome="   << rec.outcome;
        if (rec.bytes >= 0)         out << " bytes="     << rec.bytes;
        if (rec.piece >= 0)         out << " piece="     << rec.piece;
        return out.str();
    }

    // -------- StdoutSink: atomic per-line emission --------
    void StdoutSink::write(const LogRecord& rec) {
        std::osyncstream out(std::cout);
        out << renderLine(rec) << '\n';
    }

    void StderrSink::write(const LogRecord& rec) {
        std::osyncstream out(std::cerr);
        out << renderLine(rec) << '\n';
    }

    // -------- FileSink: mutex-serialized writes --------
    FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

    void FileSink::write(const LogRecord& rec) {
        if (!out_) return;
        std::scoped_lock lk(mu_);
        out_ << renderLine(rec) << '\n';
        out_.flush();
    }

} // namespace healer::logger
