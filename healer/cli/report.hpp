#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "../recovery/include/bzip2_header.hpp"
#include "../recovery/include/gzip_header.hpp"
#include "../recovery/include/types.hpp"


namespace healer::cli {

    // Machine-readable forms of the CLI's three outputs (--json).

    nlohmann::json toJson(const recovery::RecoveryResult& r);
    nlohmann::json toJson(const recovery::GzipHeader& h);
    nlohmann::json toJson(const recovery::Bzip2Header& h);
    nlohmann::json verifyToJson(const std::map<std::string, bool>& results);

    // Indented dump; invalid UTF-8 in names becomes U+FFFD instead of throwing.
    std::string dumpReport(const nlohmann::json& j);

} // namespace healer::cli
