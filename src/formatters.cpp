#include "formatters.hpp"
#include <ctime>
#include <vector>

namespace sandbox_tail {

const char* const kContentTypePlainText = "text/plain";
const char* const kContentTypeJSON = "application/json";
const char* const kContentTypeEventStream = "text/event-stream";

namespace {

std::string dump_entry(const JournalEntry& entry) {
    try {
        return entry.to_json().dump();
    } catch (const nlohmann::json::exception& e) {
        throw FormatError(std::string("cannot encode entry ") + entry.cursor + ": " + e.what());
    }
}

// ANSI C layout, e.g. "Mon Jan  2 15:04:05 2006"
std::string ansic_time(uint64_t realtime_usec) {
    std::time_t seconds = static_cast<std::time_t>(realtime_usec / 1000000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%a %b %e %H:%M:%S %Y", &tm);
    return std::string(buf, n);
}

} // namespace

JournalEntry EntryFormatter::line_to_entry(const Line& line) {
    JournalEntry entry;
    entry.fields["MESSAGE"] = line.message;
    entry.cursor = std::to_string(line.offset);
    return entry;
}

std::string EntryFormatter::format_line(const Line& line) const {
    return format_entry(line_to_entry(line));
}

std::string FormatText::content_type() const {
    return kContentTypePlainText;
}

std::string FormatText::format_entry(const JournalEntry& entry) const {
    auto message = entry.fields.find("MESSAGE");
    if (message == entry.fields.end()) {
        return "";
    }

    std::vector<std::string> parts;
    parts.push_back(ansic_time(entry.realtime_timestamp));
    auto field = entry.fields.find("_HOSTNAME");
    if (field != entry.fields.end()) parts.push_back(field->second);
    field = entry.fields.find("SYSLOG_IDENTIFIER");
    if (field != entry.fields.end()) parts.push_back(field->second);
    field = entry.fields.find("_PID");
    if (field != entry.fields.end()) parts.push_back("[" + field->second + "]");
    parts.push_back(message->second);

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ' ';
        out += parts[i];
    }
    out += '\n';
    return out;
}

std::string FormatText::format_line(const Line& line) const {
    return line.message + "\n";
}

std::string FormatJSON::content_type() const {
    return kContentTypeJSON;
}

std::string FormatJSON::format_entry(const JournalEntry& entry) const {
    return dump_entry(entry) + "\n";
}

std::string FormatSSE::content_type() const {
    return kContentTypeEventStream;
}

std::string FormatSSE::format_entry(const JournalEntry& entry) const {
    return "data: " + dump_entry(entry) + "\n\n";
}

std::unique_ptr<EntryFormatter> formatter_for_accept(const std::string& accept) {
    if (accept.find(kContentTypeEventStream) != std::string::npos) {
        return std::make_unique<FormatSSE>();
    }
    if (accept.find(kContentTypeJSON) != std::string::npos) {
        return std::make_unique<FormatJSON>();
    }
    return std::make_unique<FormatText>();
}

std::unique_ptr<EntryFormatter> formatter_by_name(const std::string& name) {
    if (name == "text") return std::make_unique<FormatText>();
    if (name == "json") return std::make_unique<FormatJSON>();
    if (name == "sse") return std::make_unique<FormatSSE>();
    throw std::invalid_argument("unknown format: " + name);
}

} // namespace sandbox_tail
