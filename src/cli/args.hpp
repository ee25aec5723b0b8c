#ifndef EVALIGN_CLI_ARGS_HPP
#define EVALIGN_CLI_ARGS_HPP

#include "evalign/evaluation.hpp"

#include <stdexcept>
#include <string>

namespace evalign {
namespace cli {

// Thrown by the parsers instead of calling exit(); the subcommand returns
// exit_code() after printing what() (if any) to stderr.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& msg = std::string())
        : std::runtime_error(msg), exit_code_(code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// evalign match
struct Options {
    std::string generated_file;       // -g
    std::string reference_file;       // -r
    std::string output;               // -o: CSV path, or directory when ending in '/'
    EvaluationOptions eval;
    bool quiet = false;               // no console report
    bool verbose = false;             // loading / timing messages on stderr
};

// evalign batch
struct BatchOptions {
    std::string manifest_file;        // name<TAB>generated<TAB>reference
    std::string output_file = "batch_summary.tsv";
    std::string records_dir;          // per-pair records CSV when set
    EvaluationOptions eval;
    int num_threads = 0;              // 0 = OpenMP default
    bool verbose = false;
};

void print_version();
void print_usage(const char* program_name);
void print_batch_usage(const char* program_name);

// Handles one matcher / filter flag shared by all subcommands.
// Returns false if argv[i] is not one of them; advances i past its value.
bool consume_eval_flag(int argc, char* argv[], int& i, EvaluationOptions& eval);

// Throws ParseArgsExit(0) for --help/--version and
// ParseArgsExit(1, msg) for missing inputs, bad values or unknown options
Options parse_args(int argc, char* argv[]);
BatchOptions parse_batch_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace evalign

#endif  // EVALIGN_CLI_ARGS_HPP
