// evalign match: evaluate one generated / reference pair
//
// Writes the records CSV and <csv stem>_summary.json, then prints the report.

#include "subcommand.hpp"
#include "args.hpp"
#include "evalign/evaluation.hpp"
#include "evalign/log_utils.hpp"
#include "evalign/report.hpp"

#include <chrono>
#include <fstream>
#include <iostream>

namespace evalign {
namespace cli {

namespace {

void write_file(const std::string& path, const Evaluation& ev,
                void (*writer)(std::ostream&, const Evaluation&)) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    writer(out, ev);
    if (!out) {
        throw std::runtime_error("Error writing " + path);
    }
}

void write_records(std::ostream& os, const Evaluation& ev) {
    write_records_csv(os, ev.records);
}

}  // namespace

int cmd_match(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        auto t_start = std::chrono::steady_clock::now();

        if (opts.verbose) {
            std::cerr << "Generated: " << opts.generated_file << "\n";
            std::cerr << "Reference: " << opts.reference_file << "\n";
            std::cerr << "Matcher:   " << match_method_to_string(opts.eval.matcher.method) << "\n";
        }

        Evaluation ev = evaluate_files(opts.generated_file, opts.reference_file, opts.eval);

        if (opts.verbose) {
            std::cerr << "Loaded " << ev.generated.size() << " generated events ("
                      << format_time(ev.coverage.generated_time_start) << " - "
                      << format_time(ev.coverage.generated_time_end) << ")\n";
            std::cerr << "Loaded " << ev.reference.size() << " reference events"
                      << (opts.eval.range_filter ? " in time range" : "") << "\n";
            std::cerr << "Matched into " << ev.records.size() << " records\n";
        }

        const std::string csv_path =
            make_output_path(opts.generated_file, opts.reference_file, opts.output);
        const std::string json_path = summary_path_for(csv_path);

        write_file(csv_path, ev, write_records);
        write_file(json_path, ev, write_summary_json);

        if (!opts.quiet) {
            print_report(std::cout, ev);
            std::cout << "Records saved to: " << csv_path << "\n";
            std::cout << "Summary saved to: " << json_path << "\n";
        }

        if (opts.verbose) {
            std::cerr << "Done in "
                      << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now())
                      << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
    struct MatchRegistrar {
        MatchRegistrar() {
            SubcommandRegistry::instance().register_command(
                "match",
                "Match one generated event table against a reference",
                cmd_match, 10);
        }
    };
    static MatchRegistrar registrar;
}

}  // namespace cli
}  // namespace evalign
