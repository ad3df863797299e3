#include "harbor/core/command_line_parser.hpp"
#include <iostream>
#include "harbor/version.hpp"
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace harbor::core {

CommandLineOptions CommandLineParser::parse(int argc, char* argv[]) {
    CommandLineOptions options;
    po::options_description desc("Allowed options");
    desc.add_options()
        ("version,v", "Print version information")
        ("config,c", po::value<std::string>(), "Specify configuration file")
        ("test,t", po::value<std::string>(), "Validate configuration file and exit")
        ("help,h", "Print help information")
    ;

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            options.show_help = true;
            std::cout << desc << std::endl;
        }

        if (vm.count("version")) {
            options.show_version = true;
            std::cout << "harbord v" << harbor::VERSION << " (Git Commit: " << GIT_COMMIT_HASH << ")" << std::endl;
        }

        if (vm.count("config")) {
            options.config_file = vm["config"].as<std::string>();
        }
        if (vm.count("test")) {
            options.config_file = vm["test"].as<std::string>();
            options.test = true;
        }
    }
    catch (const po::error& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        options.show_help = true; // Show help on error
        options.parse_error = true;
    }

    return options;
}

} // namespace harbor::core
