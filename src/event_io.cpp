#include "evalign/event_io.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <limits>
#include <nlohmann/json.hpp>
#include <zlib.h>

namespace evalign {

// Large I/O buffer for zlib
constexpr unsigned GZBUF_SIZE = 1024 * 1024;

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Whole-string numeric parses (no trailing garbage)
bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_long(const std::string& s, long& out) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    out = v;
    return true;
}

int find_column(const std::vector<std::string>& header,
                std::initializer_list<const char*> names) {
    for (const char* name : names) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Strips a UTF-8 byte order mark
void strip_bom(std::string& line) {
    if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
}

bool keep_in_range(const Event& e, const EventTableOptions& options) {
    if (!options.time_range) return true;
    return e.start <= options.time_range->second && e.end >= options.time_range->first;
}

const nlohmann::json* find_key(const nlohmann::json& item,
                               std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = item.find(name);
        if (it != item.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

double json_timestamp(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) return parse_timestamp(value.get<std::string>());
    throw std::invalid_argument("timestamp must be a string or a number");
}

}  // namespace

// ============================================================================
// Timestamps
// ============================================================================

double parse_timestamp(const std::string& text) {
    const std::string s = trim(text);

    std::vector<std::string> parts;
    size_t pos = 0;
    while (true) {
        size_t colon = s.find(':', pos);
        parts.push_back(s.substr(pos, colon == std::string::npos ? std::string::npos : colon - pos));
        if (colon == std::string::npos) break;
        pos = colon + 1;
    }

    double seconds = 0.0;
    long hours = 0;
    long minutes = 0;
    bool ok = false;

    if (parts.size() == 3) {
        ok = parse_long(parts[0], hours) && parse_long(parts[1], minutes) &&
             parse_double(parts[2], seconds);
    } else if (parts.size() == 2) {
        ok = parse_long(parts[0], minutes) && parse_double(parts[1], seconds);
    } else if (parts.size() == 1) {
        ok = parse_double(parts[0], seconds);
    }

    if (!ok) {
        throw std::invalid_argument("Invalid timestamp: '" + text + "'");
    }
    return static_cast<double>(hours) * 3600.0 + static_cast<double>(minutes) * 60.0 + seconds;
}

std::string format_time(double seconds) {
    char buf[64];
    if (seconds >= 3600.0) {
        long hours = static_cast<long>(seconds / 3600.0);
        long minutes = static_cast<long>(std::fmod(seconds, 3600.0) / 60.0);
        double secs = std::fmod(seconds, 60.0);
        std::snprintf(buf, sizeof(buf), "%ld:%02ld:%05.2f", hours, minutes, secs);
    } else {
        long minutes = static_cast<long>(std::floor(seconds / 60.0));
        double secs = seconds - 60.0 * static_cast<double>(minutes);
        std::snprintf(buf, sizeof(buf), "%ld:%05.2f", minutes, secs);
    }
    return buf;
}

// ============================================================================
// LineReader
// ============================================================================

class LineReader::Impl {
public:
    gzFile file_ = nullptr;
    std::string path_;
    char buffer_[65536];

    ~Impl() {
        if (file_) gzclose(file_);
    }

    bool getline(std::string& line) {
        line.clear();
        bool got_any = false;
        while (gzgets(file_, buffer_, sizeof(buffer_)) != nullptr) {
            got_any = true;
            size_t len = std::strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                break;
            }
            // No newline: either the buffer filled up or this is the last line
            line.append(buffer_, len);
        }

        if (!got_any) {
            int errnum = Z_OK;
            const char* msg = gzerror(file_, &errnum);
            if (errnum != Z_OK && errnum != Z_STREAM_END) {
                throw EventTableError("Error reading " + path_ + ": " + msg);
            }
            return false;
        }

        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }
};

LineReader::LineReader(const std::string& path) : impl_(std::make_unique<Impl>()) {
    impl_->path_ = path;
    impl_->file_ = gzopen(path.c_str(), "rb");
    if (!impl_->file_) {
        throw EventTableError("Could not open " + path);
    }
    gzbuffer(impl_->file_, GZBUF_SIZE);
}

LineReader::~LineReader() = default;

bool LineReader::getline(std::string& line) {
    if (!impl_->getline(line)) return false;
    line_number_++;
    return true;
}

// ============================================================================
// Delimited records
// ============================================================================

bool split_record(const std::string& line, char delimiter, std::vector<std::string>& fields) {
    fields.clear();
    std::string field;
    bool in_quotes = false;
    bool at_field_start = true;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == delimiter) {
            fields.push_back(field);
            field.clear();
            at_field_start = true;
            continue;
        }
        if (c == '"' && at_field_start) {
            in_quotes = true;
            at_field_start = false;
            continue;
        }
        field += c;
        at_field_start = false;
    }

    if (in_quotes) return false;
    fields.push_back(field);
    return true;
}

// ============================================================================
// Event tables
// ============================================================================

std::vector<Event> read_event_table(const std::string& path, const EventTableOptions& options) {
    LineReader reader(path);

    std::string line;
    std::string header_line;
    while (reader.getline(line)) {
        if (!trim(line).empty()) {
            header_line = line;
            break;
        }
    }
    if (header_line.empty()) {
        throw EventTableError(path + ": empty event table");
    }

    strip_bom(header_line);

    const char delimiter = header_line.find('\t') != std::string::npos ? '\t' : ',';

    std::vector<std::string> header;
    if (!split_record(header_line, delimiter, header)) {
        throw EventTableError(path + ": unterminated quote in header");
    }
    for (auto& name : header) name = to_lower(trim(name));

    const int start_col = find_column(header, {"start", "start_time"});
    const int end_col = find_column(header, {"end", "end_time"});
    const int text_col = find_column(header, {"text", "description"});
    const int speech_col = find_column(header, {"speech_type"});

    if (start_col < 0 || end_col < 0 || text_col < 0) {
        throw EventTableError(path + ": header needs start, end and text columns");
    }
    const size_t min_fields =
        static_cast<size_t>(std::max({start_col, end_col, text_col, speech_col})) + 1;

    std::vector<Event> events;
    std::vector<std::string> fields;

    while (reader.getline(line)) {
        if (trim(line).empty()) continue;

        const size_t record_line = reader.line_number();
        std::string record = line;
        while (!split_record(record, delimiter, fields)) {
            std::string next;
            if (!reader.getline(next)) {
                throw EventTableError(path + ":" + std::to_string(record_line) +
                                      ": unterminated quoted field");
            }
            record += '\n';
            record += next;
        }

        if (fields.size() < min_fields) {
            throw EventTableError(path + ":" + std::to_string(record_line) + ": expected " +
                                  std::to_string(min_fields) + " fields, found " +
                                  std::to_string(fields.size()));
        }

        if (options.filter_speech_type && speech_col >= 0 &&
            trim(fields[speech_col]) != options.speech_type) {
            continue;
        }

        Event e;
        try {
            e.start = parse_timestamp(fields[start_col]);
            e.end = parse_timestamp(fields[end_col]);
        } catch (const std::invalid_argument& ex) {
            throw EventTableError(path + ":" + std::to_string(record_line) + ": " + ex.what());
        }

        if (!keep_in_range(e, options)) continue;

        e.text = fields[text_col];
        e.index = static_cast<int>(events.size());
        events.push_back(std::move(e));
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const Event& a, const Event& b) { return a.start < b.start; });
    return events;
}

std::vector<Event> read_event_json(const std::string& path, const EventTableOptions& options) {
    std::string content;
    {
        LineReader reader(path);
        std::string line;
        while (reader.getline(line)) {
            content += line;
            content += '\n';
        }
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& ex) {
        throw EventTableError(path + ": invalid JSON: " + ex.what());
    }
    if (!doc.is_object()) {
        throw EventTableError(path + ": expected a JSON object with \"audio_descriptions\"");
    }

    std::vector<Event> events;
    auto list = doc.find("audio_descriptions");
    if (list == doc.end() || list->is_null()) return events;
    if (!list->is_array()) {
        throw EventTableError(path + ": \"audio_descriptions\" must be an array");
    }

    for (size_t k = 0; k < list->size(); ++k) {
        const nlohmann::json& item = (*list)[k];
        const std::string where = path + ": audio_descriptions[" + std::to_string(k) + "]";
        if (!item.is_object()) {
            throw EventTableError(where + ": expected an object");
        }

        if (options.filter_speech_type) {
            const nlohmann::json* speech = find_key(item, {"speech_type"});
            if (speech && speech->is_string() &&
                trim(speech->get<std::string>()) != options.speech_type) {
                continue;
            }
        }

        const nlohmann::json* start = find_key(item, {"start_time", "start"});
        const nlohmann::json* end = find_key(item, {"end_time", "end"});
        if (!start || !end) {
            throw EventTableError(where + ": needs start_time and end_time");
        }

        Event e;
        try {
            e.start = json_timestamp(*start);
            e.end = json_timestamp(*end);
        } catch (const std::invalid_argument& ex) {
            throw EventTableError(where + ": " + ex.what());
        }
        if (!keep_in_range(e, options)) continue;

        const nlohmann::json* text = find_key(item, {"description", "text"});
        if (text) {
            if (!text->is_string()) {
                throw EventTableError(where + ": description must be a string");
            }
            e.text = text->get<std::string>();
        }

        e.index = static_cast<int>(events.size());
        events.push_back(std::move(e));
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const Event& a, const Event& b) { return a.start < b.start; });
    return events;
}

std::vector<Event> read_events(const std::string& path, const EventTableOptions& options) {
    const std::string lower = to_lower(path);
    if (ends_with(lower, ".json") || ends_with(lower, ".json.gz")) {
        return read_event_json(path, options);
    }

    bool looks_like_json = false;
    {
        LineReader reader(path);
        std::string line;
        while (reader.getline(line)) {
            strip_bom(line);
            const std::string t = trim(line);
            if (t.empty()) continue;
            looks_like_json = t[0] == '{';
            break;
        }
    }
    return looks_like_json ? read_event_json(path, options) : read_event_table(path, options);
}

void write_event_table(const std::string& path, const std::vector<Event>& events) {
    std::ofstream out(path);
    if (!out) {
        throw EventTableError("Could not open " + path + " for writing");
    }

    out << "start\tend\ttext\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& e : events) {
        std::string text = e.text;
        std::replace_if(text.begin(), text.end(),
                        [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
        out << e.start << '\t' << e.end << '\t' << text << '\n';
    }

    if (!out) {
        throw EventTableError("Error writing " + path);
    }
}

}  // namespace evalign
