// evalign batch: evaluate every pair listed in a manifest
//
// Manifest rows are name<TAB>generated<TAB>reference. Blank lines and
// lines starting with '#' are skipped, as is a leading header row.
// Names are unique and name the per-pair records file, so they may not
// contain '/'.
// Pairs run in parallel; the summary keeps manifest order and a pair that
// fails is reported in the status column without stopping the others.

#include "subcommand.hpp"
#include "args.hpp"
#include "evalign/evaluation.hpp"
#include "evalign/event_io.hpp"
#include "evalign/log_utils.hpp"
#include "evalign/report.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <unordered_map>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace evalign {
namespace cli {

namespace {

struct ManifestEntry {
    std::string name;
    std::string generated;
    std::string reference;
};

struct PairResult {
    bool ok = false;
    std::string error;
    Evaluation ev;
};

bool is_header_row(const std::vector<std::string>& fields) {
    return fields.size() >= 3 && fields[0] == "name" && fields[1] == "generated" &&
           fields[2] == "reference";
}

std::vector<ManifestEntry> read_manifest(const std::string& path) {
    LineReader reader(path);
    std::vector<ManifestEntry> entries;
    std::unordered_map<std::string, size_t> first_seen;  // name -> line
    std::vector<std::string> fields;
    std::string line;

    while (reader.getline(line)) {
        if (line.empty() || line[0] == '#') continue;
        if (!split_record(line, '\t', fields)) {
            throw EventTableError(path + ":" + std::to_string(reader.line_number()) +
                                  ": unterminated quoted field");
        }
        if (entries.empty() && is_header_row(fields)) continue;
        if (fields.size() < 3 || fields[1].empty() || fields[2].empty()) {
            throw EventTableError(path + ":" + std::to_string(reader.line_number()) +
                                  ": expected name<TAB>generated<TAB>reference");
        }
        const std::string where = path + ":" + std::to_string(reader.line_number());
        const std::string& name = fields[0];
        if (name.empty() || name == "." || name == ".." ||
            name.find('/') != std::string::npos) {
            throw EventTableError(where + ": invalid pair name '" + name + "'");
        }
        auto seen = first_seen.emplace(name, reader.line_number());
        if (!seen.second) {
            throw EventTableError(where + ": duplicate pair name '" + name + "' (first on line " +
                                  std::to_string(seen.first->second) + ")");
        }
        entries.push_back({name, fields[1], fields[2]});
    }
    return entries;
}

// Keep error messages on one TSV cell
std::string one_cell(std::string s) {
    std::replace_if(s.begin(), s.end(),
                    [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
    return s;
}

void write_summary_tsv(std::ostream& os, const std::vector<ManifestEntry>& entries,
                       const std::vector<PairResult>& results) {
    os << "name\tstatus\tmatcher\tgen_total\tref_total\tgen_matched\tref_matched\t"
          "records\tprecision\trecall\tf1\terror\n";
    os << std::fixed << std::setprecision(4);
    for (size_t k = 0; k < entries.size(); ++k) {
        const PairResult& r = results[k];
        os << entries[k].name << '\t';
        if (!r.ok) {
            os << "error\t\t\t\t\t\t\t\t\t\t" << one_cell(r.error) << '\n';
            continue;
        }
        const CoverageStats& c = r.ev.coverage;
        os << "ok\t" << r.ev.matcher << '\t'
           << c.generated_total << '\t' << c.reference_total << '\t'
           << c.generated_matched << '\t' << c.reference_matched << '\t'
           << r.ev.records.size() << '\t'
           << c.precision << '\t' << c.recall << '\t' << c.f1 << "\t\n";
    }
}

}  // namespace

int cmd_batch(int argc, char* argv[]) {
    BatchOptions opts;
    try {
        opts = parse_batch_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        auto t_start = std::chrono::steady_clock::now();

        // Fail before any work if the matcher configuration is invalid
        const auto matcher = make_matcher(opts.eval.matcher);

        const std::vector<ManifestEntry> entries = read_manifest(opts.manifest_file);

        std::ofstream out(opts.output_file);
        if (!out) {
            std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
            return 1;
        }

        int runtime_threads = 1;
#ifdef _OPENMP
        runtime_threads = (opts.num_threads > 0) ? opts.num_threads : std::max(1, omp_get_num_procs());
        omp_set_dynamic(0);
        omp_set_num_threads(runtime_threads);
#endif

        if (opts.verbose) {
            std::cerr << "Matcher:  " << matcher->name() << "\n";
            std::cerr << "Manifest: " << entries.size() << " pairs, "
                      << runtime_threads << " thread(s)"
#ifdef _OPENMP
                      << "\n";
#else
                      << " (OpenMP disabled)\n";
#endif
        }

        std::vector<PairResult> results(entries.size());
        const long n_pairs = static_cast<long>(entries.size());

        #pragma omp parallel for schedule(dynamic, 1)
        for (long k = 0; k < n_pairs; ++k) {
            const ManifestEntry& entry = entries[k];
            PairResult& result = results[k];
            try {
                result.ev = evaluate_files(entry.generated, entry.reference, opts.eval);
                if (!opts.records_dir.empty()) {
                    std::string dir = opts.records_dir;
                    if (dir.back() != '/') dir += '/';
                    const std::string csv_path = dir + entry.name + ".csv";
                    std::ofstream csv(csv_path);
                    if (!csv) {
                        throw std::runtime_error("Cannot open output file: " + csv_path);
                    }
                    write_records_csv(csv, result.ev.records);
                    if (!csv) {
                        throw std::runtime_error("Error writing " + csv_path);
                    }
                }
                result.ok = true;
            } catch (const std::exception& e) {
                result.ok = false;
                result.error = e.what();
            }
        }

        write_summary_tsv(out, entries, results);
        if (!out) {
            std::cerr << "Error: Error writing " << opts.output_file << "\n";
            return 1;
        }

        size_t failed = 0;
        for (size_t k = 0; k < results.size(); ++k) {
            if (results[k].ok) continue;
            failed++;
            std::cerr << "Warning: " << entries[k].name << ": " << results[k].error << "\n";
        }

        std::cerr << "Evaluated " << entries.size() << " pairs";
        if (failed > 0) std::cerr << " (" << failed << " failed)";
        std::cerr << " in " << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now())
                  << "\n";
        std::cerr << "Summary saved to: " << opts.output_file << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
    struct BatchRegistrar {
        BatchRegistrar() {
            SubcommandRegistry::instance().register_command(
                "batch",
                "Match every pair listed in a manifest (parallel)",
                cmd_batch, 20);
        }
    };
    static BatchRegistrar registrar;
}

}  // namespace cli
}  // namespace evalign
