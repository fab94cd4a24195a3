#include "parser.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>

bool CommandParser::is_command(const std::string& text) {
    std::string trimmed = util::trim(text);
    return !trimmed.empty() && trimmed[0] == '/';
}

ParsedCommand CommandParser::parse(const std::string& text) {
    ParsedCommand result;

    std::string trimmed = util::trim(text);
    if (trimmed.empty() || trimmed[0] != '/') {
        result.error = "Not a command";
        return result;
    }

    // Remove leading /
    trimmed = trimmed.substr(1);

    auto tokens = util::split(trimmed, ' ');
    if (tokens.empty() || util::trim(tokens[0]).empty()) {
        result.error = "Empty command";
        return result;
    }

    result.cmd = util::trim(tokens[0]);

    // Group chats address commands as /cmd@bot_name
    auto at = result.cmd.find('@');
    if (at != std::string::npos) {
        result.cmd = result.cmd.substr(0, at);
    }
    std::transform(result.cmd.begin(), result.cmd.end(), result.cmd.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (size_t i = 1; i < tokens.size(); i++) {
        std::string arg = util::trim(tokens[i]);
        if (!arg.empty()) {
            result.args.push_back(arg);
        }
    }

    if (!is_valid_command(result.cmd)) {
        result.error = "Unknown command: /" + result.cmd;
        return result;
    }

    return result;
}

bool CommandParser::is_valid_command(const std::string& cmd) {
    static const std::vector<std::string> valid_commands = {
        "start", "help", "status", "stats"
    };

    return std::find(valid_commands.begin(), valid_commands.end(), cmd)
           != valid_commands.end();
}
