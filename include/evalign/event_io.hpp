#pragma once

#include "types.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace evalign {

// Malformed or unreadable event table
class EventTableError : public std::runtime_error {
public:
    explicit EventTableError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Convert a timestamp to seconds.
 *   "1:23:45.5" -> 5025.5   (H:MM:SS)
 *   "7:01.7"    -> 421.7    (M:SS)
 *   "421.7"     -> 421.7    (seconds)
 * Throws std::invalid_argument for anything else.
 */
double parse_timestamp(const std::string& text);

// "7:01.70" below one hour, "1:23:45.50" from one hour on
std::string format_time(double seconds);

/**
 * Line reader over plain or gzip-compressed files.
 * zlib passes uncompressed input through unchanged.
 */
class LineReader {
public:
    explicit LineReader(const std::string& path);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Next line without the trailing newline / carriage return. False on EOF.
    bool getline(std::string& line);

    // 1-based number of the last line returned
    size_t line_number() const { return line_number_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    size_t line_number_ = 0;
};

// Split one delimited record. Handles "quoted" fields with "" escapes.
// Returns false if a quoted field is still open at the end of `line`.
bool split_record(const std::string& line, char delimiter, std::vector<std::string>& fields);

struct EventTableOptions {
    bool filter_speech_type = true;     // keep only speech_type == "ad" when that column exists
    std::string speech_type = "ad";
    std::optional<std::pair<double, double>> time_range;  // keep start <= max && end >= min
};

/**
 * Read events from a CSV / TSV table (optionally .gz).
 *
 * Columns (header aliases): start|start_time, end|end_time,
 * text|description, optional speech_type. Timestamps accept every
 * parse_timestamp format. Indices follow row order after filtering;
 * the result is stably sorted by start.
 */
std::vector<Event> read_event_table(const std::string& path,
                                    const EventTableOptions& options = EventTableOptions());

/**
 * Read events from a JSON document (optionally .gz):
 *
 *   {"audio_descriptions": [
 *       {"start_time": "0:05.2", "end_time": "0:10.5", "description": "A man walks"}, ...]}
 *
 * Item keys take the same aliases as the table columns; timestamps may be
 * strings in any parse_timestamp format or plain numbers. A missing
 * "audio_descriptions" key means no events. Filtering, index assignment
 * and ordering follow read_event_table.
 */
std::vector<Event> read_event_json(const std::string& path,
                                   const EventTableOptions& options = EventTableOptions());

// JSON for *.json / *.json.gz or when the first non-blank character is '{',
// a delimited table otherwise
std::vector<Event> read_events(const std::string& path,
                               const EventTableOptions& options = EventTableOptions());

// TSV with start, end, text columns
void write_event_table(const std::string& path, const std::vector<Event>& events);

}  // namespace evalign
