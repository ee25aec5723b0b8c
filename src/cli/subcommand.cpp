#include "subcommand.hpp"
#include "evalign/version.h"

#include <algorithm>
#include <iostream>

namespace evalign {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    commands_.push_back({name, description, order, std::move(fn)});
    std::stable_sort(commands_.begin(), commands_.end(),
                     [](const CommandEntry& a, const CommandEntry& b) {
                         return a.order < b.order;
                     });
}

const SubcommandRegistry::CommandEntry* SubcommandRegistry::find(const std::string& name) const {
    auto it = std::find_if(commands_.begin(), commands_.end(),
                           [&](const CommandEntry& c) { return c.name == name; });
    return it == commands_.end() ? nullptr : &*it;
}

bool SubcommandRegistry::has_command(const std::string& name) const {
    return find(name) != nullptr;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    const CommandEntry* entry = find(name);
    if (!entry) {
        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'evalign --help' for usage information.\n";
        return 1;
    }
    return entry->fn(argc, argv);
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << "evalign v" << EVALIGN_VERSION
              << " - align generated and reference event timelines\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";

    size_t max_len = 0;
    for (const auto& cmd : commands_) {
        max_len = std::max(max_len, cmd.name.length());
    }
    for (const auto& cmd : commands_) {
        std::cout << "  " << cmd.name << std::string(max_len + 2 - cmd.name.length(), ' ')
                  << cmd.description << "\n";
    }

    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace evalign
