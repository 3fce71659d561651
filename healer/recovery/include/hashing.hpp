#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include "types.hpp"


namespace healer::recovery {

    using Sha1Digest   = std::array<std::uint8_t, 20>;
    using Sha256Digest = std::array<std::uint8_t, 32>;

    Sha1Digest sha1(std::span<const std::uint8_t> data);
    Sha256Digest sha256(std::span<const std::uint8_t> data);

    // Digest bytes of the chosen algorithm (20 for SHA-1, 32 for SHA-256).
    Bytes digest(HashAlgo algo, std::span<const std::uint8_t> data);

    std::string toHex(std::span<const std::uint8_t> data);


    // Running CRC32 (zlib polynomial) plus byte count.
    class Crc32Accumulator
    {
    public:
        void update(std::span<const std::uint8_t> chunk);

        std::uint32_t crc() const noexcept { return crc_; }
        std::uint64_t size() const noexcept { return size_; }

        // (crc32, size mod 2^32), the shape a gzip trailer stores.
        GzipTrailer trailer() const noexcept {
            return GzipTrailer{crc_, static_cast<std::uint32_t>(size_ & 0xFFFFFFFFu)};
        }

    private:
        std::uint32_t crc_{0};
        std::uint64_t size_{0};
    };

} // namespace healer::recovery
