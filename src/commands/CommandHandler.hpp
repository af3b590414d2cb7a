#pragma once
#include <string>
#include <vector>

class CommandHandler {
public:
    static int execute(const std::string& command, const std::vector<std::string>& args);

private:
    static int handle_copy(const std::vector<std::string>& args);
    static int handle_plan(const std::vector<std::string>& args);
    static int handle_digest(const std::vector<std::string>& args);
};
