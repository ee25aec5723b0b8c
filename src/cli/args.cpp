#include "args.hpp"
#include "evalign/version.h"

#include <iostream>
#include <string>

namespace evalign {
namespace cli {

namespace {

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw ParseArgsExit(1, "Error: Missing value for " + flag);
    }
    return argv[++i];
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

double parse_double(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        double parsed = std::stod(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
    }
}

void print_matcher_options() {
    std::cout << "\nMatcher:\n";
    std::cout << "  --matcher <name>         cluster, overlap or dp (default: cluster)\n";
    std::cout << "  --min-overlap <sec>      Min overlap to link events (cluster, overlap; default: 0.5)\n";
    std::cout << "\nDP matcher:\n";
    std::cout << "  --w-time <float>         Weight of time similarity (default: 0.3)\n";
    std::cout << "  --w-text <float>         Weight of text similarity (default: 0.7)\n";
    std::cout << "  --gap-gen <float>        Penalty for skipping a generated event (default: -0.2)\n";
    std::cout << "  --gap-ref <float>        Penalty for skipping a reference event (default: -0.2)\n";
    std::cout << "  --time-scale <sec>       Decay of soft time similarity (default: 10.0)\n";
    std::cout << "  --hard-time              Temporal IoU instead of soft time similarity\n";
    std::cout << "\nReference filtering:\n";
    std::cout << "  --keep-all-speech        Keep every row, not only speech_type == ad\n";
    std::cout << "  --no-range-filter        Keep reference events outside the generated time range\n";
}

}  // namespace

void print_version() {
    std::cout << "evalign " << EVALIGN_VERSION << "\n";
}

void print_usage(const char* program_name) {
    std::cout << "evalign match v" << EVALIGN_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " -g <generated> -r <reference> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -g, --generated <file>   Generated events (CSV/TSV, or .gz)\n";
    std::cout << "  -r, --reference <file>   Reference events (CSV/TSV, or .gz)\n";
    std::cout << "  -o, --output <path>      Records CSV, or a directory ending in '/'\n";
    std::cout << "                           (default: auto-named next to the generated file)\n";
    std::cout << "  -q, --quiet              No console report\n";
    print_matcher_options();
    std::cout << "\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -g gen.tsv -r ref.csv\n";
    std::cout << "  " << program_name << " -g gen.tsv -r ref.csv --matcher dp -o out/\n";
}

void print_batch_usage(const char* program_name) {
    std::cout << "evalign batch v" << EVALIGN_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " -i <manifest.tsv> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -i, --manifest <file>    Rows: name<TAB>generated<TAB>reference\n";
    std::cout << "  -o, --output <file>      Summary TSV (default: batch_summary.tsv)\n";
    std::cout << "  --records-dir <dir>      Also write <name>.csv records per pair\n";
    std::cout << "  -t, --threads <int>      Number of threads (default: auto)\n";
    print_matcher_options();
    std::cout << "\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
}

bool consume_eval_flag(int argc, char* argv[], int& i, EvaluationOptions& eval) {
    const std::string arg = argv[i];
    MatcherParams& m = eval.matcher;

    if (arg == "--matcher") {
        const std::string name = require_value(argc, argv, i, arg);
        try {
            m.method = parse_match_method(name);
        } catch (const std::invalid_argument& e) {
            throw ParseArgsExit(1, std::string("Error: ") + e.what());
        }
    } else if (arg == "--min-overlap") {
        m.min_overlap_sec = parse_double(arg, require_value(argc, argv, i, arg));
        if (m.min_overlap_sec < 0.0) {
            throw ParseArgsExit(1, "Error: --min-overlap must be >= 0");
        }
    } else if (arg == "--w-time") {
        m.w_time = parse_double(arg, require_value(argc, argv, i, arg));
    } else if (arg == "--w-text") {
        m.w_text = parse_double(arg, require_value(argc, argv, i, arg));
    } else if (arg == "--gap-gen") {
        m.gap_penalty_generated = parse_double(arg, require_value(argc, argv, i, arg));
    } else if (arg == "--gap-ref") {
        m.gap_penalty_reference = parse_double(arg, require_value(argc, argv, i, arg));
    } else if (arg == "--time-scale") {
        m.time_scale = parse_double(arg, require_value(argc, argv, i, arg));
        if (m.time_scale <= 0.0) {
            throw ParseArgsExit(1, "Error: --time-scale must be > 0");
        }
    } else if (arg == "--hard-time") {
        m.time_soft = false;
    } else if (arg == "--keep-all-speech") {
        eval.filter_speech_type = false;
    } else if (arg == "--no-range-filter") {
        eval.range_filter = false;
    } else {
        return false;
    }
    return true;
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-g" || arg == "--generated") {
            opts.generated_file = require_value(argc, argv, i, arg);
        } else if (arg == "-r" || arg == "--reference") {
            opts.reference_file = require_value(argc, argv, i, arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output = require_value(argc, argv, i, arg);
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!consume_eval_flag(argc, argv, i, opts.eval)) {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.generated_file.empty()) {
        throw ParseArgsExit(1, "Error: No generated file specified (-g)");
    }
    if (opts.reference_file.empty()) {
        throw ParseArgsExit(1, "Error: No reference file specified (-r)");
    }
    if (opts.quiet && opts.verbose) {
        throw ParseArgsExit(1, "Error: --quiet and --verbose are mutually exclusive");
    }

    return opts;
}

BatchOptions parse_batch_args(int argc, char* argv[]) {
    BatchOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_batch_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--manifest") {
            opts.manifest_file = require_value(argc, argv, i, arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(argc, argv, i, arg);
        } else if (arg == "--records-dir") {
            opts.records_dir = require_value(argc, argv, i, arg);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(argc, argv, i, arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!consume_eval_flag(argc, argv, i, opts.eval)) {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.manifest_file.empty()) {
        throw ParseArgsExit(1, "Error: No manifest specified (-i)");
    }

    return opts;
}

}  // namespace cli
}  // namespace evalign
