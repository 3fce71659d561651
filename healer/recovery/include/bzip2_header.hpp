#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include "types.hpp"


namespace healer::recovery {

    namespace bzip2fmt {
        inline constexpr std::size_t kFixedHeaderSize = 4;   // "BZh" + level digit
        inline constexpr std::size_t kLevelPos = 3;
    }

    struct Bzip2Header
    {
        int level{9};   // 1..9, block size level * 100k

        bool operator==(const Bzip2Header&) const = default;
    };

    struct Bzip2HeaderCodec
    {
        static std::optional<Bzip2Header> parse(std::span<const std::uint8_t> data);
        static std::optional<Bzip2Header> parse(const std::filesystem::path& path);

        static std::string format(const Bzip2Header& header);

        // Overwrites the level digit; anything that is not a bzip2 stream, or a
        // target level outside 1..9, comes back unmodified.
        static Bytes patch(Bytes data, const Bzip2Header& target);
    };

} // namespace healer::recovery
