#pragma once

#include <string>
#include <vector>
#include <optional>

struct ParsedCommand {
    std::string cmd;
    std::vector<std::string> args;
    std::optional<std::string> error;

    bool is_valid() const { return !error.has_value(); }
};

class CommandParser {
public:
    static bool is_command(const std::string& text);

    // "/status@my_bot arg" -> {"status", {"arg"}}
    static ParsedCommand parse(const std::string& text);

private:
    static bool is_valid_command(const std::string& cmd);
};
