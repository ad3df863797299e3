#pragma once
#include <string>

namespace harbor::core {

struct CommandLineOptions {
    bool show_version = false;
    bool show_help = false;
    bool test = false;
    bool parse_error = false;
    std::string config_file = "config/harbor.yaml";
};

class CommandLineParser {
public:
    static CommandLineOptions parse(int argc, char* argv[]);
};

} // namespace harbor::core
