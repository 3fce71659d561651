#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>


namespace healer::recovery {

    using Bytes = std::vector<std::uint8_t>;

    enum class HashAlgo { sha1, sha256 };

    enum class ContainerFormat { gzip, bzip2 };


    // A proposed compressed stream and the tool/level/flag combination behind it.
    struct Candidate
    {
        std::string label;
        Bytes data;
    };


    // gzip trailer: CRC32 of the decompressed data and its size mod 2^32.
    struct GzipTrailer
    {
        std::uint32_t crc32{0};
        std::uint32_t isize{0};
        auto operator<=>(const GzipTrailer&) const = default;
    };


    struct RecoveryResult
    {
        std::size_t recovered{0};   // reconstructed byte-exact and hash-verified
        std::size_t gzipped{0};     // raw-fallback output, not hash-verified
        std::size_t skipped{0};     // target exists and overwrite is off
        std::size_t missing{0};     // nothing usable, or no match without fallback
        auto operator<=>(const RecoveryResult&) const = default;
    };

} // namespace healer::recovery
