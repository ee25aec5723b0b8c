#ifndef EVALIGN_CLI_SUBCOMMAND_HPP
#define EVALIGN_CLI_SUBCOMMAND_HPP

#include <functional>
#include <string>
#include <vector>

namespace evalign {
namespace cli {

// argv[0] is the subcommand name
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Subcommands register themselves from static initializers in their own
// translation units, so those sources must be linked into the executable.
class SubcommandRegistry {
public:
    struct CommandEntry {
        std::string name;
        std::string description;
        int order;
        SubcommandFn fn;
    };

    static SubcommandRegistry& instance();

    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    bool has_command(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    void print_help(const char* program_name) const;

    const std::vector<CommandEntry>& commands() const {
        return commands_;
    }

private:
    SubcommandRegistry() = default;
    const CommandEntry* find(const std::string& name) const;

    std::vector<CommandEntry> commands_;
};

int cmd_match(int argc, char* argv[]);
int cmd_batch(int argc, char* argv[]);

}  // namespace cli
}  // namespace evalign

#endif  // EVALIGN_CLI_SUBCOMMAND_HPP
