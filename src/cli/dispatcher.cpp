// evalign entry point
//
// Usage:
//   evalign match -g gen.tsv -r ref.csv [options]   Evaluate one pair
//   evalign batch -i manifest.tsv -o summary.tsv    Evaluate many pairs

#include "subcommand.hpp"
#include "evalign/version.h"

#include <cstring>
#include <iostream>

int main(int argc, char* argv[]) {
    auto& registry = evalign::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(argv[0]);
        return 0;
    }

    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        std::cout << "evalign " << EVALIGN_VERSION << "\n";
        return 0;
    }

    if (registry.has_command(first_arg)) {
        return registry.run_command(first_arg, argc - 1, argv + 1);
    }

    std::cerr << "Unknown command: " << first_arg << "\n";
    std::cerr << "Run 'evalign --help' for usage information.\n";
    return 1;
}
