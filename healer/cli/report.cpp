#include "report.hpp"


namespace healer::cli {

    using nlohmann::json;

    static std::string as_text(const recovery::Bytes& b) {
        return std::string(b.begin(), b.end());
    }

    json toJson(const recovery::RecoveryResult& r) {
        return json{
            {"recovered", r.recovered},
            {"gzipped", r.gzipped},
            {"skipped", r.skipped},
            {"missing", r.missing},
        };
    }

    json toJson(const recovery::GzipHeader& h) {
        json j{
            {"format", "gzip"},
            {"mtime", h.mtime},
            {"os", h.os},
            {"flags", h.flags},
            {"flag_names", recovery::GzipHeaderCodec::flagNames(h.flags)},
        };
        if (h.extra) j["extra_bytes"] = h.extra->size();
        // names may hold arbitrary bytes, see dumpReport
        if (h.fname) j["fname"] = as_text(*h.fname);
        if (h.fcomment) j["fcomment"] = as_text(*h.fcomment);
        return j;
    }

    json toJson(const recovery::Bzip2Header& h) {
        return json{
            {"format", "bzip2"},
            {"level", h.level},
            {"block_size", h.level * 100000},
        };
    }

    json verifyToJson(const std::map<std::string, bool>& results) {
        json j = json::object();
        for (const auto& [path, ok] : results) j[path] = ok;
        return j;
    }

    std::string dumpReport(const json& j) {
        return j.dump(2, ' ', false, json::error_handler_t::replace);
    }

} // namespace healer::cli
