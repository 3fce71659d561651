#include <algorithm>
#include <exception>
#include "cli.hpp"
#include "report.hpp"
#include "../metainfo/metainfo.hpp"
#include "../recovery/include/bzip2_header.hpp"
#include "../recovery/include/gzip_header.hpp"
#include "../recovery/include/orchestrator.hpp"
#include "../recovery/include/trailer_verify.hpp"


namespace healer::cli {

    using recovery::Expected;

    std::string usage(const std::string& prog) {
        return "Usage: " + prog + " <torrent> <raw_dir> <partial_dir> <target_dir> [options]\n"
               "\n"
               "Options:\n"
               "  --raw-fallback     compress raw files directly when no candidate matches\n"
               "  --overwrite        replace existing target files\n"
               "  --dry-run          report outcomes without writing anything\n"
               "  --header-info      print headers of .gz/.bz2 files in partial_dir and exit\n"
               "  --verify-only      check gzip trailers against raw files and exit\n"
               "  --json             print results as JSON\n"
               "  --log-level L      trace|debug|info|warn|error|none (default info)\n"
               "  --log-file P       append log lines to P instead of stdout\n"
               "  -h, --help         show this text\n";
    }

    Expected<CliOptions> parseCliOptions(const std::vector<std::string>& args) {
        CliOptions opts;
        std::vector<std::string> positional;

        for (std::size_t i = 0; i < args.size(); ++i) {
            const auto& a = args[i];

            auto next = [&]() -> const std::string* {
                return i + 1 < args.size() ? &args[++i] : nullptr;
            };

            if (a == "-h" || a == "--help") { opts.mode = Mode::help; return Expected<CliOptions>::success(opts); }
            else if (a == "--raw-fallback") opts.rawFallback = true;
            else if (a == "--overwrite")    opts.overwrite = true;
            else if (a == "--dry-run")      opts.dryRun = true;
            else if (a == "--header-info")  opts.mode = Mode::headerInfo;
            else if (a == "--verify-only")  opts.mode = Mode::verifyOnly;
            else if (a == "--json")         opts.json = true;
            else if (a == "--log-level") {
                const auto* v = next();
                if (!v) return Expected<CliOptions>::failure("--log-level needs a value");
                auto lvl = logger::parseLevel(*v);
                if (!lvl) return Expected<CliOptions>::failure("unknown log level: " + *v);
                opts.logLevel = *lvl;
            }
            else if (a == "--log-file") {
                const auto* v = next();
                if (!v) return Expected<CliOptions>::failure("--log-file needs a value");
                opts.logFile = *v;
            }
            else if (a.size() > 1 && a[0] == '-') {
                return Expected<CliOptions>::failure("unknown option: " + a);
            }
            else positional.push_back(a);
        }

        if (positional.size() != 4) {
            return Expected<CliOptions>::failure("expected 4 positional arguments, got " +
                                                 std::to_string(positional.size()));
        }
        opts.torrent    = positional[0];
        opts.rawDir     = positional[1];
        opts.partialDir = positional[2];
        opts.targetDir  = positional[3];
        return Expected<CliOptions>::success(std::move(opts));
    }


    namespace {

        std::shared_ptr<logger::Logger> make_logger(const CliOptions& opts, std::ostream& err) {
            std::shared_ptr<logger::ILoggerSink> sink;
            if (!opts.logFile.empty()) {
                auto fs = std::make_shared<logger::FileSink>(opts.logFile);
                if (fs->isOpen()) sink = fs;
                else err << "warning: cannot open log file " << opts.logFile << ", logging to stdout\n";
            }
            if (!sink && opts.json) sink = std::make_shared<logger::StderrSink>();
            if (!sink) sink = std::make_shared<logger::StdoutSink>();

            auto log = std::make_shared<logger::Logger>(sink);
            log->setLevel(opts.logLevel);
            return log;
        }

        int header_info(const CliOptions& opts, std::ostream& out) {
            std::vector<std::filesystem::path> files;
            if (std::filesystem::is_directory(opts.partialDir)) {
                for (const auto& e : std::filesystem::recursive_directory_iterator(opts.partialDir)) {
                    if (!e.is_regular_file()) continue;
                    const auto ext = e.path().extension();
                    if (ext == ".gz" || ext == ".bz2") files.push_back(e.path());
                }
            }
            std::sort(files.begin(), files.end());

            if (opts.json) {
                auto doc = nlohmann::json::object();
                for (const auto& p : files) {
                    const auto rel = std::filesystem::relative(p, opts.partialDir).generic_string();
                    if (p.extension() == ".gz") {
                        auto h = recovery::GzipHeaderCodec::parse(p);
                        doc[rel] = h ? toJson(*h) : nlohmann::json(nullptr);
                    } else {
                        auto h = recovery::Bzip2HeaderCodec::parse(p);
                        doc[rel] = h ? toJson(*h) : nlohmann::json(nullptr);
                    }
                }
                out << dumpReport(doc) << "\n";
                return 0;
            }

            for (const auto& p : files) {
                const auto rel = std::filesystem::relative(p, opts.partialDir).generic_string();
                out << "== " << rel << " ==\n";
                if (p.extension() == ".gz") {
                    auto h = recovery::GzipHeaderCodec::parse(p);
                    out << (h ? recovery::GzipHeaderCodec::format(*h) : std::string("(not a gzip header)")) << "\n";
                } else {
                    auto h = recovery::Bzip2HeaderCodec::parse(p);
                    out << (h ? recovery::Bzip2HeaderCodec::format(*h) : std::string("(not a bzip2 header)")) << "\n";
                }
            }
            return 0;
        }

        int verify_only(const CliOptions& opts, std::ostream& out) {
            const auto meta = metainfo::Metainfo::fromFile(opts.torrent);
            const auto results = recovery::verifyLastPieceAgainstRaw(meta, opts.rawDir, opts.partialDir);

            bool allOk = true;
            if (opts.json) {
                for (const auto& [path, ok] : results) allOk = allOk && ok;
                out << dumpReport(verifyToJson(results)) << "\n";
                return allOk ? 0 : 1;
            }
            for (const auto& [path, ok] : results) {
                out << (ok ? "OK   " : "FAIL ") << path << "\n";
                allOk = allOk && ok;
            }
            return allOk ? 0 : 1;
        }

        int run_recovery(const CliOptions& opts, std::ostream& out, std::ostream& err) {
            const auto meta = metainfo::Metainfo::fromFile(opts.torrent);
            auto log = make_logger(opts, err);

            const auto r = recovery::recover(meta, opts.rawDir, opts.partialDir, opts.targetDir,
                                             opts.rawFallback, opts.overwrite, opts.dryRun, log);

            if (opts.json) out << dumpReport(toJson(r)) << "\n";
            else out << "recovered: " << r.recovered << "\n"
                << "gzipped:   " << r.gzipped << "\n"
                << "skipped:   " << r.skipped << "\n"
                << "missing:   " << r.missing << "\n";
            return r.missing > 0 ? 2 : 0;
        }

    } // namespace


    int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
        auto parsed = parseCliOptions(args);
        if (!parsed.has_value()) {
            err << "Error: " << parsed.message() << "\n" << usage("torrent-healer");
            return 1;
        }
        const CliOptions& opts = parsed.get();

        try {
            switch (opts.mode) {
                case Mode::help:       out << usage("torrent-healer"); return 0;
                case Mode::headerInfo: return header_info(opts, out);
                case Mode::verifyOnly: return verify_only(opts, out);
                case Mode::recover:    return run_recovery(opts, out, err);
            }
        } catch (const std::exception& e) {
            err << "Error: " << e.what() << "\n";
            return 1;
        }
        return 1;
    }

} // namespace healer::cli
