#pragma once
// Subcommand table of the cubkit CLI. Every cmd_*.cpp adds its commands
// from a static registrar; main() hands argv to dispatch().

#include "args.hpp"
#include "cubkit/log_utils.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cubkit {
namespace cli {

// Work of one subcommand, run once its arguments are parsed
using CommandBody = std::function<void(const Options&, log_utils::StepLogger&)>;

struct Subcommand {
    std::string name;
    std::string summary;
    int order = 99;       // position in the help listing
    CommandBody body;
};

class SubcommandRegistry {
public:
    static SubcommandRegistry& instance();

    // Kept sorted by order. Throws std::logic_error on a repeated name.
    void add(Subcommand cmd);

    // nullptr for unknown names
    const Subcommand* find(const std::string& name) const;

    /**
     * Top-level entry: argv[1] is a command name, --help or --version.
     * The command sees argv shifted by one. Returns the process exit code.
     */
    int dispatch(int argc, char* argv[]) const;

    void print_help(const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::vector<Subcommand> commands_;
};

}  // namespace cli
}  // namespace cubkit
