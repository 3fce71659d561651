#pragma once
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "../logger/logger.hpp"
#include "../recovery/include/expected.hpp"


namespace healer::cli {

    enum class Mode { recover, headerInfo, verifyOnly, help };

    struct CliOptions
    {
        std::filesystem::path torrent;
        std::filesystem::path rawDir;
        std::filesystem::path partialDir;
        std::filesystem::path targetDir;

        Mode mode{Mode::recover};
        bool rawFallback{false};
        bool overwrite{false};
        bool dryRun{false};
        bool json{false};             // print results as one JSON document

        logger::LogLevel logLevel{logger::LogLevel::info};
        std::string logFile;          // empty: stdout
    };

    // args excludes the program name.
    recovery::Expected<CliOptions> parseCliOptions(const std::vector<std::string>& args);

    std::string usage(const std::string& prog);

    // Exit codes: 0 ok, 1 usage error / failed verification / hard error,
    // 2 recovery left files missing.
    int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace healer::cli
