#pragma once

#include "evaluation.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace evalign {

// One row per record, matched and unmatched alike. Missing values are
// empty cells.
void write_records_csv(std::ostream& os, const std::vector<Correspondence>& records);

// precision / recall / f1 are rounded to 4 decimals
void write_summary_json(std::ostream& os, const Evaluation& ev);

// Console report
void print_report(std::ostream& os, const Evaluation& ev);

/**
 * Output path for a generated / reference pair.
 *
 * A non-empty output_arg that does not end in '/' is returned as is.
 * Otherwise the name is
 *   <prefix>_<generated stem[:40]>_vs_<reference stem[:25]>_<YYYYmmdd_HHMMSS><ext>
 * placed in output_arg, or next to the generated file when output_arg is empty.
 */
std::string make_output_path(const std::string& generated_path,
                             const std::string& reference_path,
                             const std::string& output_arg,
                             const std::string& prefix = "eval",
                             const std::string& extension = ".csv");

// "run.csv" -> "run_summary.json"
std::string summary_path_for(const std::string& csv_path);

// CSV field, quoted only when it contains a comma, quote or line break
std::string csv_escape(const std::string& field);

std::string json_escape(const std::string& s);

}  // namespace evalign
