#include <algorithm>
#include <limits>
#include <openssl/sha.h>
#include <zlib.h>
#include "../include/hashing.hpp"


namespace healer::recovery {

    Sha1Digest sha1(std::span<const std::uint8_t> data) {
        Sha1Digest out{};
        SHA1(data.data(), data.size(), out.data());
        return out;
    }

    Sha256Digest sha256(std::span<const std::uint8_t> data) {
        Sha256Digest out{};
        SHA256(data.data(), data.size(), out.data());
        return out;
    }

    Bytes digest(HashAlgo algo, std::span<const std::uint8_t> data) {
        switch (algo) {
            case HashAlgo::sha1: {
                const auto d = sha1(data);
                return Bytes(d.begin(), d.end());
            }
            case HashAlgo::sha256: {
                const auto d = sha256(data);
                return Bytes(d.begin(), d.end());
            }
        }
        return {};
    }

    std::string toHex(std::span<const std::uint8_t> data) {
        static const char* kDigits = "0123456789abcdef";
        std::string out;
        out.reserve(data.size() * 2);
        for (std::uint8_t b : data) {
            out.push_back(kDigits[b >> 4]);
            out.push_back(kDigits[b & 0x0F]);
        }
        return out;
    }

    void Crc32Accumulator::update(std::span<const std::uint8_t> chunk) {
        // zlib takes uInt lengths; feed oversized chunks in slices
        const std::uint8_t* p = chunk.data();
        std::size_t left = chunk.size();
        while (left > 0) {
            const auto n = static_cast<uInt>(std::min<std::size_t>(left, std::numeric_limits<uInt>::max()));
            crc_ = static_cast<std::uint32_t>(::crc32(crc_, p, n));
            p += n;
            left -= n;
        }
        size_ += chunk.size();
    }

} // namespace healer::recovery
