#include <algorithm>
#include <iomanip>
#include <sstream>
#include "../include/gzip_header.hpp"
#include "../include/file_io.hpp"


namespace healer::recovery {

    using namespace gzipfmt;

    namespace {

        struct FieldSpan { std::size_t begin{0}, end{0}; };

        // Byte ranges of the optional fields a buffer currently carries.
        struct CurrentLayout
        {
            std::optional<FieldSpan> extra, fname, fcomment, hcrc;
            std::size_t payloadBegin{kFixedHeaderSize};
        };

        void put_le16(Bytes& b, std::uint16_t v) {
            b.push_back(static_cast<std::uint8_t>(v & 0xFF));
            b.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        }

        // End (exclusive, past the NUL) of a zero-terminated field starting at pos.
        std::optional<std::size_t> zeroTerminatedEnd(std::span<const std::uint8_t> d, std::size_t pos) {
            auto it = std::find(d.begin() + static_cast<std::ptrdiff_t>(pos), d.end(), std::uint8_t{0});
            if (it == d.end()) return std::nullopt;
            return static_cast<std::size_t>(it - d.begin()) + 1;
        }

        std::optional<CurrentLayout> scanLayout(std::span<const std::uint8_t> d) {
            CurrentLayout lay;
            const std::uint8_t flags = d[kFlagsPos];
            std::size_t pos = kFixedHeaderSize;

            if (flags & kFExtra) {
                if (d.size() < pos + 2) return std::nullopt;
                const std::size_t end = pos + 2 + readLe16(d.data() + pos);
                if (end > d.size()) return std::nullopt;
                lay.extra = FieldSpan{pos, end};
                pos = end;
            }
            if (flags & kFName) {
                auto end = zeroTerminatedEnd(d, pos);
                if (!end) return std::nullopt;
                lay.fname = FieldSpan{pos, *end};
                pos = *end;
            }
            if (flags & kFComment) {
                auto end = zeroTerminatedEnd(d, pos);
                if (!end) return std::nullopt;
                lay.fcomment = FieldSpan{pos, *end};
                pos = *end;
            }
            if (flags & kFHcrc) {
                if (d.size() < pos + 2) return std::nullopt;
                lay.hcrc = FieldSpan{pos, pos + 2};
                pos += 2;
            }
            lay.payloadBegin = pos;
            return lay;
        }

        const char* osName(std::uint8_t os) {
            switch (os) {
                case 0:  return "FAT";
                case 1:  return "Amiga";
                case 2:  return "VMS";
                case 3:  return "Unix";
                case 4:  return "VM/CMS";
                case 5:  return "Atari TOS";
                case 6:  return "HPFS";
                case 7:  return "Macintosh";
                case 8:  return "Z-System";
                case 9:  return "CP/M";
                case 10: return "TOPS-20";
                case 11: return "NTFS";
                case 12: return "QDOS";
                case 13: return "Acorn RISCOS";
                case 255: return "unknown";
                default: return "unassigned";
            }
        }

        std::string printable(const Bytes& b) {
            std::ostringstream oss;
            for (std::uint8_t c : b) {
                if (c >= 0x20 && c < 0x7F && c != '\\') oss << static_cast<char>(c);
                else oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << int(c) << std::dec;
            }
            return oss.str();
        }

    } // namespace


    std::optional<GzipHeader> GzipHeaderCodec::parse(std::span<const std::uint8_t> d) {
        if (d.size() < kFixedHeaderSize || d[0] != kMagic0 || d[1] != kMagic1) return std::nullopt;
        if (d[kMethodPos] != kMethodDeflate) return std::nullopt;

        // FHCRC is tolerated but not modelled
        auto lay = scanLayout(d);
        if (!lay) return std::nullopt;

        GzipHeader h;
        h.flags = d[kFlagsPos];
        h.mtime = readLe32(d.data() + kMtimePos);
        h.os = d[kOsPos];

        auto slice = [&](const FieldSpan& s, std::size_t skipFront, std::size_t skipBack) {
            return Bytes(d.begin() + static_cast<std::ptrdiff_t>(s.begin + skipFront),
                         d.begin() + static_cast<std::ptrdiff_t>(s.end - skipBack));
        };
        if (lay->extra)    h.extra    = slice(*lay->extra, 2, 0);
        if (lay->fname)    h.fname    = slice(*lay->fname, 0, 1);
        if (lay->fcomment) h.fcomment = slice(*lay->fcomment, 0, 1);
        return h;
    }

    std::optional<GzipHeader> GzipHeaderCodec::parse(const std::filesystem::path& path) {
        const Bytes head = io::readHead(path, kHeaderReadLimit);
        return parse(std::span<const std::uint8_t>(head));
    }


    std::vector<std::string> GzipHeaderCodec::flagNames(std::uint8_t flags) {
        static const std::pair<std::uint8_t, const char*> kNames[] = {
            {kFText, "FTEXT"}, {kFHcrc, "FHCRC"}, {kFExtra, "FEXTRA"}, {kFName, "FNAME"},
            {kFComment, "FCOMMENT"}, {kReserved1, "RESERVED1"}, {kReserved2, "RESERVED2"},
            {kReserved3, "RESERVED3"},
        };

        std::vector<std::string> out;
        for (const auto& [bit, name] : kNames) {
            if (flags & bit) out.emplace_back(name);
        }
        return out;
    }

    std::string GzipHeaderCodec::format(const GzipHeader& h) {
        std::ostringstream oss;
        oss << "mtime: " << h.mtime << "\n";
        oss << "OS: " << int(h.os) << " (" << osName(h.os) << ")\n";

        oss << "flags: ";
        for (int bit = 7; bit >= 0; --bit) oss << ((h.flags >> bit) & 1);
        oss << "\n";

        const auto names = flagNames(h.flags);
        oss << "flag_names: ";
        if (names.empty()) oss << "(none)";
        for (std::size_t i = 0; i < names.size(); ++i) oss << (i ? ", " : "") << names[i];

        if (h.extra)    oss << "\nextra: " << h.extra->size() << " bytes";
        if (h.fname)    oss << "\nfname: " << printable(*h.fname);
        if (h.fcomment) oss << "\nfcomment: " << printable(*h.fcomment);
        return oss.str();
    }


    Bytes GzipHeaderCodec::patch(Bytes data, const GzipHeader& target) {
        if (data.size() < kFixedHeaderSize) return data;

        const std::span<const std::uint8_t> in(data);
        const auto lay = scanLayout(in);
        if (!lay) return data;
        if (target.extra && target.extra->size() > 0xFFFF) return data;

        // Rebuild the header into a fresh buffer; a single read cursor over
        // `in` keeps inserted and removed fields from shifting each other.
        Bytes out;
        out.reserve(data.size() + 64);
        out.insert(out.end(), in.begin(), in.begin() + kFixedHeaderSize);

        out[kFlagsPos] = target.flags;
        for (std::size_t i = 0; i < 4; ++i) {
            out[kMtimePos + i] = static_cast<std::uint8_t>((target.mtime >> (8 * i)) & 0xFF);
        }
        out[kXflPos] = 0;
        out[kOsPos] = target.os;

        auto copySpan = [&](const FieldSpan& s) {
            out.insert(out.end(), in.begin() + static_cast<std::ptrdiff_t>(s.begin),
                                  in.begin() + static_cast<std::ptrdiff_t>(s.end));
        };

        if (target.flags & kFExtra) {
            if (target.extra) {
                put_le16(out, static_cast<std::uint16_t>(target.extra->size()));
                out.insert(out.end(), target.extra->begin(), target.extra->end());
            } else if (lay->extra) {
                copySpan(*lay->extra);
            } else {
                put_le16(out, 0);
            }
        }

        auto reconcileString = [&](std::uint8_t bit, const std::optional<Bytes>& value,
                                   const std::optional<FieldSpan>& current) {
            if (!(target.flags & bit)) return;
            if (value) {
                out.insert(out.end(), value->begin(), value->end());
                out.push_back(0);
            } else if (current) {
                copySpan(*current);
            } else {
                out.push_back(0);
            }
        };
        reconcileString(kFName, target.fname, lay->fname);
        reconcileString(kFComment, target.fcomment, lay->fcomment);

        // an existing header CRC is carried over, never synthesised
        if ((target.flags & kFHcrc) && lay->hcrc) copySpan(*lay->hcrc);

        out.insert(out.end(), in.begin() + static_cast<std::ptrdiff_t>(lay->payloadBegin), in.end());
        return out;
    }

} // namespace healer::recovery
