/**
 * @file command_console.h
 * @brief Operator command parser for the serial console
 *
 * Host commands:  start | stop | restart | status | logs | help
 * Peer commands:  connect <ssid> [passphrase] | disconnect
 *                 send <ssid> [passphrase] | status | logs | help
 *
 * Verbs are case-insensitive; arguments are kept verbatim.
 */

#ifndef COMMAND_CONSOLE_H
#define COMMAND_CONSOLE_H

#include <cstdint>
#include <string>
#include <vector>

namespace Provisioning {
namespace CommandConsole {

/** @brief Which command set applies */
enum class Role : uint8_t {
    Host,
    Peer
};

enum class CommandType : uint8_t {
    None,        ///< Blank line
    Invalid,     ///< See Command::error
    Help,
    Start,
    Stop,
    Restart,
    Status,
    Logs,
    Connect,
    Disconnect,
    Send
};

struct Command {
    CommandType type;
    std::vector<std::string> args;
    std::string error;
};

/**
 * @brief Parse one console line
 *
 * @param line Input without line terminator
 * @param role Command set to accept
 */
Command parse(const std::string& line, Role role);

/**
 * @brief Usage text for a role
 */
const char* helpText(Role role);

} // namespace CommandConsole
} // namespace Provisioning

#endif // COMMAND_CONSOLE_H
