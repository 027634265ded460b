#include <svn_bridge/cli/command_router.hpp>

#include <algorithm>
#include <iomanip>
#include <ostream>

namespace svn_bridge {

void CommandRouter::Register(const std::string& name,
                             const std::string& description,
                             CommandHandler handler) {
    CommandInfo info;
    info.name = name;
    info.description = description;
    info.handler = std::move(handler);
    commands_[name] = std::move(info);
}

void CommandRouter::Register(const std::string& name,
                             const std::string& description,
                             CommandHandler handler,
                             CommandHelp help) {
    CommandInfo info;
    info.name = name;
    info.description = description;
    info.handler = std::move(handler);
    info.help = std::move(help);
    commands_[name] = std::move(info);
}

bool CommandRouter::Has(const std::string& name) const {
    return commands_.find(name) != commands_.end();
}

std::vector<CommandInfo> CommandRouter::Commands() const {
    std::vector<CommandInfo> result;
    result.reserve(commands_.size());
    for (const auto& [name, info] : commands_) {
        result.push_back(info);
    }
    return result;
}

int CommandRouter::Dispatch(const std::string& name, const AppConfig& config,
                            std::ostream& err) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        err << "Error: unknown command '" << name << "'\n";
        PrintHelp(err);
        return 1;
    }
    return it->second.handler(config);
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    size_t width = 0;
    for (const auto& [name, info] : commands_) {
        width = std::max(width, name.size());
    }

    out << "Usage: svn-bridge <command> [targets...] [flags]\n\n";
    out << "Commands:\n";
    for (const auto& [name, info] : commands_) {
        out << "  " << std::left << std::setw(static_cast<int>(width)) << name
            << "  " << info.description << "\n";
    }
    out << "\nRun 'svn-bridge <command> --help' for details.\n";
}

bool CommandRouter::PrintCommandHelp(const std::string& name,
                                     std::ostream& out) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        return false;
    }
    const auto& info = it->second;
    if (!info.help.has_value()) {
        out << "svn-bridge " << name << " - " << info.description << "\n";
        return true;
    }

    const auto& help = *info.help;
    out << "Usage: " << help.usage << "\n\n";
    out << info.description << "\n";
    if (!help.long_description.empty()) {
        out << "\n" << help.long_description << "\n";
    }
    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& example : help.examples) {
            out << "  " << example << "\n";
        }
    }
    return true;
}

} // namespace svn_bridge
