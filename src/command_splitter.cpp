#include "mudgate/command_splitter.hpp"

namespace mudgate {

std::vector<std::string> split_commands(std::string_view text, char separator) {
    std::vector<std::string> commands;
    std::string current;
    bool escaped = false;

    for (char c : text) {
        if (escaped) {
            current.push_back(c);
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == separator) {
            commands.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }

    if (!current.empty()) {
        commands.push_back(std::move(current));
    }

    return commands;
}

} // namespace mudgate
