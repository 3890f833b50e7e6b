#pragma once

#include "journal_entry.hpp"
#include "line.hpp"
#include <string>
#include <memory>
#include <stdexcept>

namespace sandbox_tail {

extern const char* const kContentTypePlainText;
extern const char* const kContentTypeJSON;
extern const char* const kContentTypeEventStream;

// An entry or line that cannot be encoded (e.g. invalid UTF-8 under JSON)
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Encodes journal entries and file lines for one response content type
class EntryFormatter {
public:
    virtual ~EntryFormatter() = default;

    virtual std::string content_type() const = 0;
    virtual std::string format_entry(const JournalEntry& entry) const = 0;

    // Default: the line as an entry with MESSAGE and its byte offset as cursor
    virtual std::string format_line(const Line& line) const;

    static JournalEntry line_to_entry(const Line& line);
};

// "<date> <_HOSTNAME> <SYSLOG_IDENTIFIER> [<_PID>] <MESSAGE>\n"
class FormatText : public EntryFormatter {
public:
    std::string content_type() const override;
    std::string format_entry(const JournalEntry& entry) const override;
    std::string format_line(const Line& line) const override;
};

// One JSON object per line
class FormatJSON : public EntryFormatter {
public:
    std::string content_type() const override;
    std::string format_entry(const JournalEntry& entry) const override;
};

// Server-sent events: "data: {...}\n\n"
class FormatSSE : public EntryFormatter {
public:
    std::string content_type() const override;
    std::string format_entry(const JournalEntry& entry) const override;
};

// Picks a formatter from an HTTP Accept header; text is the fallback
std::unique_ptr<EntryFormatter> formatter_for_accept(const std::string& accept);

// "text", "json" or "sse"; throws std::invalid_argument otherwise
std::unique_ptr<EntryFormatter> formatter_by_name(const std::string& name);

} // namespace sandbox_tail
