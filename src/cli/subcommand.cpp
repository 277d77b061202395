#include "subcommand.hpp"
#include "pipeline.hpp"
#include "cubkit/version.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace cubkit {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::add(Subcommand cmd) {
    if (find(cmd.name)) {
        throw std::logic_error("Subcommand registered twice: " + cmd.name);
    }
    auto pos = std::upper_bound(commands_.begin(), commands_.end(), cmd.order,
                                [](int order, const Subcommand& c) { return order < c.order; });
    commands_.insert(pos, std::move(cmd));
}

const Subcommand* SubcommandRegistry::find(const std::string& name) const {
    for (const auto& cmd : commands_) {
        if (cmd.name == name) return &cmd;
    }
    return nullptr;
}

int SubcommandRegistry::dispatch(int argc, char* argv[]) const {
    const char* program_name = argc > 0 ? argv[0] : "cubkit";
    if (argc < 2) {
        print_help(program_name);
        return 1;
    }

    const std::string first = argv[1];
    if (first == "--help" || first == "-h") {
        print_help(program_name);
        return 0;
    }
    if (first == "--version" || first == "-V") {
        print_version();
        return 0;
    }

    const Subcommand* cmd = find(first);
    if (!cmd) {
        std::cerr << "Unknown command: " << first << "\n";
        std::cerr << "Run 'cubkit --help' for usage information.\n";
        return 1;
    }
    return run_subcommand(cmd->name, argc - 1, argv + 1, cmd->body);
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << "cubkit v" << CUBKIT_VERSION << " - codon usage bias toolkit\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";

    size_t width = 0;
    for (const auto& cmd : commands_) width = std::max(width, cmd.name.size());

    for (const auto& cmd : commands_) {
        std::cout << "  " << cmd.name << std::string(width + 2 - cmd.name.size(), ' ')
                  << cmd.summary << "\n";
    }

    std::cout << "\nShared input options: -i, -o, -g, -t, -v and the QC flags (see any\n"
                 "command's --help). Sequences failing QC are dropped with a warning.\n";
    std::cout << "For help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace cubkit
