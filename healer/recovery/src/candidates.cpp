#include <algorithm>
#include "../include/candidates.hpp"
#include "../include/file_io.hpp"
#include "../include/hashing.hpp"
#include "../include/native_compress.hpp"


namespace healer::recovery {

    using logger::LogLevel;

    namespace {

        constexpr int kSweepLevels[] = {1, 6, 9};
        constexpr int kHeaderMatchGzipLevel = 9;
        const char* const kHeaderMatchLabel = "header_match";

        // Turns a tool invocation into a plan; failures are logged and dropped.
        CandidatePlan tool_plan(std::shared_ptr<IProcessRunner> runner,
                                std::shared_ptr<logger::Logger> log,
                                std::filesystem::path source,
                                ToolSettings settings,
                                std::function<Bytes(Bytes)> postProcess)
        {
            std::string label = settings.label();
            return CandidatePlan{label,
                [runner = std::move(runner), log = std::move(log), source = std::move(source),
                 settings = std::move(settings), post = std::move(postProcess), label]() -> std::optional<Candidate> {
                    auto out = compressWithTool(*runner, source, settings);
                    if (!out.has_value()) {
                        TH_LOG(log, LogLevel::debug, "CandidateEngine") << "skipping " << label << ": " << out.message();
                        return std::nullopt;
                    }
                    Bytes data = out.take();
                    if (post) data = post(std::move(data));
                    return Candidate{label, std::move(data)};
                }};
        }

        bool window_matches(const Bytes& data, std::span<const std::uint8_t> target,
                            std::uint64_t offset, std::uint64_t length, HashAlgo algo)
        {
            if (offset > data.size() || data.size() - offset < length) return false;
            const auto window = std::span<const std::uint8_t>(data).subspan(
                static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
            const Bytes got = digest(algo, window);
            return std::equal(got.begin(), got.end(), target.begin(), target.end());
        }

    } // namespace


    // ---------- ToolSettings ----------

    std::string ToolSettings::label() const {
        std::string s = tool + " -" + std::to_string(level);
        if (noName) s += " -n";
        if (rsyncable) s += " --rsyncable";
        return s;
    }

    std::vector<std::string> ToolSettings::argv(const std::filesystem::path& source) const {
        std::vector<std::string> a{tool, "-" + std::to_string(level)};
        if (noName) a.emplace_back("-n");
        if (rsyncable) a.emplace_back("--rsyncable");
        a.emplace_back("-c");
        a.push_back(source.string());
        return a;
    }

    Expected<Bytes> compressWithTool(IProcessRunner& runner,
                                     const std::filesystem::path& source,
                                     const ToolSettings& settings)
    {
        return runner.run(settings.argv(source));
    }


    // ---------- CandidateEngine ----------

    CandidateEngine::CandidateEngine(std::shared_ptr<IProcessRunner> runner,
                                     std::shared_ptr<logger::Logger> log)
    : runner_(std::move(runner)), log_(std::move(log)) {}

    bool CandidateEngine::probe(const std::vector<std::string>& argv) {
        const bool ok = runner_->run(argv).has_value();
        TH_LOG(log_, LogLevel::debug, "CandidateEngine") << "probe " << argv[0] << (ok ? " available" : " unavailable");
        return ok;
    }

    const std::vector<std::string>& CandidateEngine::gzipTools() {
        if (!gzipTools_) {
            std::vector<std::string> tools{"gzip"};
            if (probe({"pigz", "--version"})) tools.emplace_back("pigz");
            gzipTools_ = std::move(tools);
        }
        return *gzipTools_;
    }

    const std::vector<std::string>& CandidateEngine::bzip2Tools() {
        if (!bzip2Tools_) {
            std::vector<std::string> tools{"bzip2"};
            if (probe({"pbzip2", "-V"})) tools.emplace_back("pbzip2");
            bzip2Tools_ = std::move(tools);
        }
        return *bzip2Tools_;
    }

    std::vector<CandidatePlan> CandidateEngine::planGzip(const std::filesystem::path& source,
                                                         const std::optional<GzipHeader>& header)
    {
        std::vector<CandidatePlan> plans;

        if (header) {
            plans.push_back(CandidatePlan{kHeaderMatchLabel,
                [source, h = *header, log = log_]() -> std::optional<Candidate> {
                    const Bytes raw = io::readAll(source);
                    auto gz = nativeGzip(raw, kHeaderMatchGzipLevel, h.mtime);
                    if (!gz.has_value()) {
                        TH_LOG(log, LogLevel::warn, "CandidateEngine") << "header_match failed: " << gz.message();
                        return std::nullopt;
                    }
                    return Candidate{kHeaderMatchLabel, GzipHeaderCodec::patch(gz.take(), h)};
                }});
        }

        std::function<Bytes(Bytes)> post;
        if (header) post = [h = *header](Bytes d) { return GzipHeaderCodec::patch(std::move(d), h); };

        for (const auto& tool : gzipTools()) {
            for (int level : kSweepLevels) {
                for (bool noName : {true, false}) {
                    const std::vector<bool> rsync = tool == "gzip" ? std::vector<bool>{false, true}
                                                                   : std::vector<bool>{false};
                    for (bool rsyncable : rsync) {
                        plans.push_back(tool_plan(runner_, log_, source,
                                                  ToolSettings{tool, level, noName, rsyncable}, post));
                    }
                }
            }
        }
        return plans;
    }

    std::vector<CandidatePlan> CandidateEngine::planBzip2(const std::filesystem::path& source,
                                                          const std::optional<Bzip2Header>& header)
    {
        std::vector<CandidatePlan> plans;

        if (header) {
            plans.push_back(CandidatePlan{kHeaderMatchLabel,
                [source, level = header->level, log = log_]() -> std::optional<Candidate> {
                    const Bytes raw = io::readAll(source);
                    auto bz = nativeBzip2(raw, level);
                    if (!bz.has_value()) {
                        TH_LOG(log, LogLevel::warn, "CandidateEngine") << "header_match failed: " << bz.message();
                        return std::nullopt;
                    }
                    return Candidate{kHeaderMatchLabel, bz.take()};
                }});
        }

        // a tool run at level N already writes "BZhN"; nothing to patch
        for (const auto& tool : bzip2Tools()) {
            for (int level : kSweepLevels) {
                plans.push_back(tool_plan(runner_, log_, source, ToolSettings{tool, level, false, false}, {}));
            }
        }
        return plans;
    }

    static std::vector<Candidate> materialise(const std::vector<CandidatePlan>& plans) {
        std::vector<Candidate> out;
        for (const auto& p : plans) {
            if (auto c = p.produce()) out.push_back(std::move(*c));
        }
        return out;
    }

    std::vector<Candidate> CandidateEngine::generateGzipCandidates(const std::filesystem::path& source,
                                                                   const std::optional<GzipHeader>& header)
    {
        return materialise(planGzip(source, header));
    }

    std::vector<Candidate> CandidateEngine::generateBzip2Candidates(const std::filesystem::path& source,
                                                                    const std::optional<Bzip2Header>& header)
    {
        return materialise(planBzip2(source, header));
    }


    // ---------- Matching ----------

    std::optional<Candidate> findMatchingCandidate(const std::vector<Candidate>& candidates,
                                                   std::span<const std::uint8_t> target,
                                                   std::uint64_t pieceLength,
                                                   HashAlgo algo)
    {
        for (const auto& c : candidates) {
            if (window_matches(c.data, target, 0, pieceLength, algo)) return c;
        }
        return std::nullopt;
    }

    std::optional<Candidate> findFirstMatch(const std::vector<CandidatePlan>& plans,
                                            std::span<const std::uint8_t> target,
                                            const MatchWindow& window,
                                            HashAlgo algo,
                                            const AcceptFn& accept)
    {
        for (const auto& p : plans) {
            auto c = p.produce();
            if (!c) continue;

            const std::uint64_t len = window.length ? *window.length
                                                    : (c->data.size() >= window.offset ? c->data.size() - window.offset : 0);
            if (!window_matches(c->data, target, window.offset, len, algo)) continue;
            if (accept && !accept(*c)) continue;
            return c;
        }
        return std::nullopt;
    }

} // namespace healer::recovery
