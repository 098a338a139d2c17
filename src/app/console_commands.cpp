#include "hidock/console/console_commands.h"

#include "hidock/console/console_transport.h"

#include <algorithm>

namespace hidock::console {

bool ConsoleCommandRegistry::register_command(ConsoleCommandSpec spec, ConsoleCommandFn fn)
{
    if (spec.name.empty() || !fn) {
        return false;
    }
    if (_cmds.find(spec.name) != _cmds.end()) {
        return false;
    }
    Entry e;
    e.spec = std::move(spec);
    e.fn = std::move(fn);
    const std::string key = e.spec.name;
    _cmds.emplace(key, std::move(e));
    return true;
}

std::optional<bool> ConsoleCommandRegistry::dispatch(const std::vector<std::string_view>& argv) const
{
    if (argv.empty()) return std::nullopt;
    auto it = _cmds.find(std::string(argv[0]));
    if (it == _cmds.end()) return std::nullopt;
    return (it->second.fn)(argv);
}

const ConsoleCommandSpec* ConsoleCommandRegistry::find(std::string_view name) const
{
    auto it = _cmds.find(std::string(name));
    return it == _cmds.end() ? nullptr : &it->second.spec;
}

void ConsoleCommandRegistry::list_commands(std::vector<ConsoleCommandSpec>& out) const
{
    out.clear();
    out.reserve(_cmds.size());
    for (const auto& kv : _cmds) {
        out.push_back(kv.second.spec);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.name < b.name;
    });
}

void ConsoleCommandRegistry::print_help(IConsoleTransport& io) const
{
    io.write_line("commands:");

    std::vector<ConsoleCommandSpec> cmds;
    list_commands(cmds);
    for (const auto& c : cmds) {
        io.write("  ");
        io.write(c.usage.empty() ? c.name : c.usage);
        if (!c.summary.empty()) {
            io.write(" - ");
            io.write(c.summary);
        }
        io.write_line("");
    }
}

} // namespace hidock::console
