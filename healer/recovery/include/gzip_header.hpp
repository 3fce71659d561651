#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "types.hpp"


namespace healer::recovery {

    namespace gzipfmt {
        inline constexpr std::uint8_t kMagic0 = 0x1f;
        inline constexpr std::uint8_t kMagic1 = 0x8b;
        inline constexpr std::uint8_t kMethodDeflate = 8;
        inline constexpr std::size_t  kFixedHeaderSize = 10;
        inline constexpr std::size_t  kTrailerSize = 8;

        inline constexpr std::size_t kMethodPos = 2;
        inline constexpr std::size_t kFlagsPos = 3;
        inline constexpr std::size_t kMtimePos = 4;
        inline constexpr std::size_t kXflPos = 8;
        inline constexpr std::size_t kOsPos = 9;

        inline constexpr std::uint8_t kFText     = 1;
        inline constexpr std::uint8_t kFHcrc     = 2;
        inline constexpr std::uint8_t kFExtra    = 4;
        inline constexpr std::uint8_t kFName     = 8;
        inline constexpr std::uint8_t kFComment  = 16;
        inline constexpr std::uint8_t kReserved1 = 32;
        inline constexpr std::uint8_t kReserved2 = 64;
        inline constexpr std::uint8_t kReserved3 = 128;

        // Upper bound read from disk: fixed header + max FEXTRA + room for names.
        inline constexpr std::size_t kHeaderReadLimit = 128 * 1024;

        // All multi-byte gzip fields are little-endian.
        inline std::uint16_t readLe16(const std::uint8_t* p) {
            return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
        }

        inline std::uint32_t readLe32(const std::uint8_t* p) {
            return std::uint32_t(p[0]) | (std::uint32_t(p[1]) << 8) |
                   (std::uint32_t(p[2]) << 16) | (std::uint32_t(p[3]) << 24);
        }
    }


    struct GzipHeader
    {
        std::uint32_t mtime{0};
        std::uint8_t os{0};
        std::uint8_t flags{0};
        std::optional<Bytes> extra;     // iff FEXTRA
        std::optional<Bytes> fname;     // iff FNAME, without the NUL
        std::optional<Bytes> fcomment;  // iff FCOMMENT, without the NUL

        bool operator==(const GzipHeader&) const = default;
    };


    struct GzipHeaderCodec
    {
        // nullopt when the bytes are not a delimitable DEFLATE gzip header.
        static std::optional<GzipHeader> parse(std::span<const std::uint8_t> data);
        static std::optional<GzipHeader> parse(const std::filesystem::path& path);

        static std::string format(const GzipHeader& header);
        static std::vector<std::string> flagNames(std::uint8_t flags);

        /**
         * @brief Impose @p target's header metadata onto a freshly produced gzip stream.
         *
         * Fixed fields (flags, mtime, OS) are overwritten in place and XFL is
         * forced to 0. Optional fields are reconciled one by one in FEXTRA,
         * FNAME, FCOMMENT order: inserted when the target has them and the
         * stream does not, replaced when both have them, spliced out when
         * only the stream has them. The deflate payload and trailer are
         * copied untouched. Buffers shorter than the fixed header, or whose
         * current optional fields cannot be delimited, are returned as is.
         */
        static Bytes patch(Bytes data, const GzipHeader& target);
    };

} // namespace healer::recovery
