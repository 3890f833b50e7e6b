#pragma once

#include <string>
#include <map>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sandbox_tail {

// The part of a systemd journal record the formatters read
struct JournalEntry {
    std::map<std::string, std::string> fields;   // MESSAGE, _HOSTNAME, _PID, ...
    std::string cursor;
    uint64_t monotonic_timestamp = 0;
    uint64_t realtime_timestamp = 0;             // Microseconds since the epoch

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["fields"] = fields;
        j["cursor"] = cursor;
        j["monotonic_timestamp"] = monotonic_timestamp;
        j["realtime_timestamp"] = realtime_timestamp;
        return j;
    }

    static JournalEntry from_json(const nlohmann::json& j) {
        JournalEntry entry;
        if (j.contains("fields")) entry.fields = j["fields"].get<std::map<std::string, std::string>>();
        entry.cursor = j.value("cursor", "");
        entry.monotonic_timestamp = j.value("monotonic_timestamp", uint64_t{0});
        entry.realtime_timestamp = j.value("realtime_timestamp", uint64_t{0});
        return entry;
    }
};

} // namespace sandbox_tail
