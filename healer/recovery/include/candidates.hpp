#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "bzip2_header.hpp"
#include "expected.hpp"
#include "gzip_header.hpp"
#include "process_runner.hpp"
#include "types.hpp"
#include "../../logger/logger.hpp"


namespace healer::recovery {

    // One external-compressor invocation: tool x level x flags.
    struct ToolSettings
    {
        std::string tool;          // "gzip", "pigz", "bzip2", "pbzip2"
        int level{9};
        bool noName{false};        // gzip family: -n
        bool rsyncable{false};     // gzip only: --rsyncable

        // "gzip -9 -n --rsyncable", "bzip2 -1"
        std::string label() const;
        std::vector<std::string> argv(const std::filesystem::path& source) const;
    };

    // Compresses source to stdout with the given settings; a missing tool or a
    // non-zero exit comes back as a failure value.
    Expected<Bytes> compressWithTool(IProcessRunner& runner,
                                     const std::filesystem::path& source,
                                     const ToolSettings& settings);


    // A candidate that is only produced when asked for. produce() returns
    // nullopt when the underlying tool is unavailable or fails.
    struct CandidatePlan
    {
        std::string label;
        std::function<std::optional<Candidate>()> produce;
    };

    // Byte range of a candidate that is hashed against the target.
    // No length means the whole candidate.
    struct MatchWindow
    {
        std::uint64_t offset{0};
        std::optional<std::uint64_t> length;
    };

    using AcceptFn = std::function<bool(const Candidate&)>;


    class CandidateEngine
    {
    public:
        explicit CandidateEngine(std::shared_ptr<IProcessRunner> runner,
                                 std::shared_ptr<logger::Logger> log = nullptr);

        // Priority order: header_match first (when a header was captured), then
        // the tool sweep. Plans capture the runner, not the engine.
        std::vector<CandidatePlan> planGzip(const std::filesystem::path& source,
                                            const std::optional<GzipHeader>& header);
        std::vector<CandidatePlan> planBzip2(const std::filesystem::path& source,
                                             const std::optional<Bzip2Header>& header);

        std::vector<Candidate> generateGzipCandidates(const std::filesystem::path& source,
                                                      const std::optional<GzipHeader>& header);
        std::vector<Candidate> generateBzip2Candidates(const std::filesystem::path& source,
                                                       const std::optional<Bzip2Header>& header);

        // Baseline tool plus variants whose version probe succeeded. Cached.
        const std::vector<std::string>& gzipTools();
        const std::vector<std::string>& bzip2Tools();

    private:
        bool probe(const std::vector<std::string>& argv);

        std::shared_ptr<IProcessRunner> runner_;
        std::shared_ptr<logger::Logger> log_;
        std::optional<std::vector<std::string>> gzipTools_;
        std::optional<std::vector<std::string>> bzip2Tools_;
    };


    // First candidate (in order) at least pieceLength bytes long whose first
    // pieceLength bytes hash to target.
    std::optional<Candidate> findMatchingCandidate(const std::vector<Candidate>& candidates,
                                                   std::span<const std::uint8_t> target,
                                                   std::uint64_t pieceLength,
                                                   HashAlgo algo = HashAlgo::sha1);

    // Lazy variant over plans: candidates are produced one at a time, the
    // window is hashed, and the first match that accept() approves wins.
    std::optional<Candidate> findFirstMatch(const std::vector<CandidatePlan>& plans,
                                            std::span<const std::uint8_t> target,
                                            const MatchWindow& window,
                                            HashAlgo algo = HashAlgo::sha1,
                                            const AcceptFn& accept = {});

} // namespace healer::recovery
