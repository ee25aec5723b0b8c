#include "evalign/report.hpp"
#include "evalign/log_utils.hpp"
#include "evalign/version.h"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace evalign {

namespace {

std::string format_number(double v) {
    std::ostringstream oss;
    oss << std::setprecision(10) << v;
    return oss.str();
}

std::string format_optional(const std::optional<double>& v) {
    return v ? format_number(*v) : std::string();
}

std::string local_timestamp(const char* fmt) {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return buf;
}

// Basename without its last extension
std::string file_stem(const std::string& path) {
    size_t slash = path.find_last_of('/');
    std::string base = (slash == std::string::npos) ? path : path.substr(slash + 1);
    size_t dot = base.find_last_of('.');
    if (dot != std::string::npos && dot > 0) base.erase(dot);
    return base;
}

std::string dir_name(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) return std::string();
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

}  // namespace

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    return out;
}

// ============================================================================
// Records CSV
// ============================================================================

void write_records_csv(std::ostream& os, const std::vector<Correspondence>& records) {
    os << "matched,match_type,gen_indices,ref_indices,gen_start,gen_end,ref_start,ref_end,"
          "text_gen,text_ref,num_gen_items,num_ref_items,score\n";

    for (const auto& rec : records) {
        os << (rec.matched ? "true" : "false") << ','
           << match_type_to_string(rec.match_type) << ','
           << csv_escape(format_indices(rec.generated_indices)) << ','
           << csv_escape(format_indices(rec.reference_indices)) << ','
           << format_optional(rec.generated_start) << ','
           << format_optional(rec.generated_end) << ','
           << format_optional(rec.reference_start) << ','
           << format_optional(rec.reference_end) << ','
           << csv_escape(rec.combined_generated_text) << ','
           << csv_escape(rec.combined_reference_text) << ','
           << rec.num_generated() << ','
           << rec.num_reference() << ','
           << format_optional(rec.score) << '\n';
    }
}

// ============================================================================
// Summary JSON
// ============================================================================

void write_summary_json(std::ostream& os, const Evaluation& ev) {
    const CoverageStats& c = ev.coverage;
    const auto flags = os.flags();
    const auto precision = os.precision();

    os << "{\n";
    os << "  \"version\": \"" << EVALIGN_VERSION << "\",\n";
    os << "  \"timestamp\": \"" << local_timestamp("%Y-%m-%d %H:%M:%S") << "\",\n";
    os << "  \"generated_file\": \"" << json_escape(ev.generated_path) << "\",\n";
    os << "  \"reference_file\": \"" << json_escape(ev.reference_path) << "\",\n";
    os << "  \"matcher\": \"" << json_escape(ev.matcher) << "\",\n";
    os << "  \"total_gen_events\": " << ev.generated.size() << ",\n";
    os << "  \"total_ref_events\": " << ev.reference.size() << ",\n";
    os << "  \"total_records\": " << ev.counts.total << ",\n";
    os << "  \"matched_records\": " << ev.counts.matched << ",\n";
    os << "  \"unmatched_gen\": " << ev.counts.unmatched_generated << ",\n";
    os << "  \"unmatched_ref\": " << ev.counts.unmatched_reference << ",\n";

    os << std::fixed << std::setprecision(4);
    os << "  \"precision\": " << c.precision << ",\n";
    os << "  \"recall\": " << c.recall << ",\n";
    os << "  \"f1_score\": " << c.f1 << ",\n";

    os << "  \"coverage\": {\n";
    os << std::setprecision(3);
    os << "    \"gen_time_start\": " << c.generated_time_start << ",\n";
    os << "    \"gen_time_end\": " << c.generated_time_end << ",\n";
    os << "    \"gen_total\": " << c.generated_total << ",\n";
    os << "    \"gen_matched\": " << c.generated_matched << ",\n";
    os << "    \"gen_unmatched\": " << c.generated_unmatched << ",\n";
    os << std::setprecision(2);
    os << "    \"gen_coverage_pct\": " << c.generated_coverage_pct << ",\n";
    os << "    \"ref_total\": " << c.reference_total << ",\n";
    os << "    \"ref_matched\": " << c.reference_matched << ",\n";
    os << "    \"ref_unmatched\": " << c.reference_unmatched << ",\n";
    os << "    \"ref_coverage_pct\": " << c.reference_coverage_pct << "\n";
    os << "  }\n";
    os << "}\n";

    os.flags(flags);
    os.precision(precision);
}

// ============================================================================
// Console report
// ============================================================================

void print_report(std::ostream& os, const Evaluation& ev) {
    const CoverageStats& c = ev.coverage;
    const auto flags = os.flags();
    const auto precision = os.precision();

    os << "\n";
    os << "======================================================================\n";
    os << "        EVALIGN MATCHING REPORT (" << ev.matcher << ")\n";
    os << "======================================================================\n\n";

    os << "INPUT:\n";
    if (!ev.generated_path.empty()) {
        os << "  Generated:  " << ev.generated_path << "\n";
        os << "  Reference:  " << ev.reference_path << "\n";
    }
    os << "  Generated events:   " << c.generated_total << "\n";
    os << "  Reference events:   " << c.reference_total << "\n";
    os << "  Time range:         " << format_time(c.generated_time_start) << " - "
       << format_time(c.generated_time_end) << "\n\n";

    os << "----------------------------------------------------------------------\n";
    os << "1. RECORDS\n";
    os << "----------------------------------------------------------------------\n";
    os << "    Total:                   " << std::setw(8) << ev.counts.total << "\n";
    os << "    Matched:                 " << std::setw(8) << ev.counts.matched << "\n";
    os << "    Unmatched (generated):   " << std::setw(8) << ev.counts.unmatched_generated << "\n";
    os << "    Unmatched (reference):   " << std::setw(8) << ev.counts.unmatched_reference << "\n\n";

    os << "----------------------------------------------------------------------\n";
    os << "2. COVERAGE\n";
    os << "----------------------------------------------------------------------\n";
    os << "  Generated: " << c.generated_matched << "/" << c.generated_total << " ("
       << log_utils::format_pct(c.generated_coverage_pct) << ")\n";
    os << "  Reference: " << c.reference_matched << "/" << c.reference_total << " ("
       << log_utils::format_pct(c.reference_coverage_pct) << ")\n\n";

    os << "----------------------------------------------------------------------\n";
    os << "3. PRECISION / RECALL\n";
    os << "----------------------------------------------------------------------\n";
    os << "    Precision: " << std::fixed << std::setprecision(4) << c.precision << "\n";
    os << "    Recall:    " << std::fixed << std::setprecision(4) << c.recall << "\n";
    os << "    F1-Score:  " << std::fixed << std::setprecision(4) << c.f1 << "\n";

    if (ev.counts.matched == 0) {
        os << "\nWARNING: no matched records\n";
    }
    os << "\n";

    os.flags(flags);
    os.precision(precision);
}

// ============================================================================
// Output naming
// ============================================================================

std::string make_output_path(const std::string& generated_path,
                             const std::string& reference_path,
                             const std::string& output_arg,
                             const std::string& prefix,
                             const std::string& extension) {
    if (!output_arg.empty() && output_arg.back() != '/') {
        return output_arg;
    }

    const std::string filename = prefix + "_" + file_stem(generated_path).substr(0, 40) +
                                 "_vs_" + file_stem(reference_path).substr(0, 25) + "_" +
                                 local_timestamp("%Y%m%d_%H%M%S") + extension;

    std::string dir = output_arg.empty() ? dir_name(generated_path) : output_arg;
    if (dir.empty()) dir = ".";
    if (dir.back() != '/') dir += '/';
    return dir + filename;
}

std::string summary_path_for(const std::string& csv_path) {
    const std::string ext = ".csv";
    if (csv_path.size() >= ext.size() &&
        csv_path.compare(csv_path.size() - ext.size(), ext.size(), ext) == 0) {
        return csv_path.substr(0, csv_path.size() - ext.size()) + "_summary.json";
    }
    return csv_path + "_summary.json";
}

}  // namespace evalign
