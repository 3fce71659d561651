#include <sstream>
#include "../include/bzip2_header.hpp"
#include "../include/file_io.hpp"


namespace healer::recovery {

    using namespace bzip2fmt;

    static bool has_magic(std::span<const std::uint8_t> d) {
        return d.size() >= kFixedHeaderSize && d[0] == 'B' && d[1] == 'Z' && d[2] == 'h';
    }

    std::optional<Bzip2Header> Bzip2HeaderCodec::parse(std::span<const std::uint8_t> d) {
        if (!has_magic(d)) return std::nullopt;
        const std::uint8_t digit = d[kLevelPos];
        if (digit < '1' || digit > '9') return std::nullopt;
        return Bzip2Header{digit - '0'};
    }

    std::optional<Bzip2Header> Bzip2HeaderCodec::parse(const std::filesystem::path& path) {
        const Bytes head = io::readHead(path, kFixedHeaderSize);
        return parse(std::span<const std::uint8_t>(head));
    }

    std::string Bzip2HeaderCodec::format(const Bzip2Header& h) {
        std::ostringstream oss;
        oss << "compression level: " << h.level << "\n";
        oss << "block size: " << h.level * 100 << "k";
        return oss.str();
    }

    Bytes Bzip2HeaderCodec::patch(Bytes data, const Bzip2Header& target) {
        if (!has_magic(data)) return data;
        if (target.level < 1 || target.level > 9) return data;
        data[kLevelPos] = static_cast<std::uint8_t>('0' + target.level);
        return data;
    }

} // namespace healer::recovery
