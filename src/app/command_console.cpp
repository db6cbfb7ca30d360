/**
 * @file command_console.cpp
 * @brief Operator command parser implementation
 */

#include "command_console.h"
#include <cctype>
#include <sstream>

namespace Provisioning {
namespace CommandConsole {

namespace {
    constexpr size_t MAX_TOKENS = 3;

    struct VerbEntry {
        const char* name;
        CommandType type;
        size_t minArgs;
        size_t maxArgs;
        const char* usage;
    };

    const VerbEntry hostVerbs[] = {
        {"help",    CommandType::Help,    0, 0, "help"},
        {"start",   CommandType::Start,   0, 0, "start"},
        {"stop",    CommandType::Stop,    0, 0, "stop"},
        {"restart", CommandType::Restart, 0, 0, "restart"},
        {"status",  CommandType::Status,  0, 0, "status"},
        {"logs",    CommandType::Logs,    0, 0, "logs"},
    };

    const VerbEntry peerVerbs[] = {
        {"help",       CommandType::Help,       0, 0, "help"},
        {"connect",    CommandType::Connect,    1, 2, "connect <ssid> [passphrase]"},
        {"disconnect", CommandType::Disconnect, 0, 0, "disconnect"},
        {"send",       CommandType::Send,       1, 2, "send <ssid> [passphrase]"},
        {"status",     CommandType::Status,     0, 0, "status"},
        {"logs",       CommandType::Logs,       0, 0, "logs"},
    };

    std::string toLower(const std::string& value) {
        std::string out(value);
        for (auto& c : out) {
            c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    template<size_t N>
    const VerbEntry* findVerb(const VerbEntry (&table)[N], const std::string& verb) {
        for (size_t i = 0; i < N; i++) {
            if (verb == table[i].name) {
                return &table[i];
            }
        }
        return nullptr;
    }

    Command invalid(const std::string& error) {
        Command cmd;
        cmd.type = CommandType::Invalid;
        cmd.error = error;
        return cmd;
    }
}

Command parse(const std::string& line, Role role) {
    std::istringstream stream(line);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }

    if (tokens.empty()) {
        Command cmd;
        cmd.type = CommandType::None;
        return cmd;
    }

    std::string verb = toLower(tokens[0]);
    const VerbEntry* entry = (role == Role::Host) ? findVerb(hostVerbs, verb)
                                                  : findVerb(peerVerbs, verb);
    if (!entry) {
        return invalid("Unknown command: " + tokens[0] + " (type help)");
    }

    if (tokens.size() > MAX_TOKENS) {
        return invalid(std::string("Too many arguments, usage: ") + entry->usage);
    }

    size_t argCount = tokens.size() - 1;
    if (argCount < entry->minArgs || argCount > entry->maxArgs) {
        return invalid(std::string("Usage: ") + entry->usage);
    }

    Command cmd;
    cmd.type = entry->type;
    cmd.args.assign(tokens.begin() + 1, tokens.end());
    return cmd;
}

const char* helpText(Role role) {
    if (role == Role::Host) {
        return "Commands:\n"
               "  start    - create the hotspot and control listener\n"
               "  stop     - tear down listener and hotspot\n"
               "  restart  - stop then start\n"
               "  status   - show hotspot state and credentials\n"
               "  logs     - print the event log\n"
               "  help     - this text";
    }
    return "Commands:\n"
           "  connect <ssid> [passphrase]  - join the host hotspot\n"
           "  disconnect                   - leave the hotspot\n"
           "  send <ssid> [passphrase]     - deliver target network to the host\n"
           "  status                       - show connection state\n"
           "  logs                         - print the event log\n"
           "  help                         - this text";
}

} // namespace CommandConsole
} // namespace Provisioning
