#include "chat/ChatTransport.hpp"

std::string ChatUpdate::command() const {
    if (!isCommand()) return "";
    std::string cmd = text.substr(0, text.find_first_of(" \n"));
    auto at = cmd.find('@');
    if (at != std::string::npos) cmd.erase(at);
    return cmd;
}
