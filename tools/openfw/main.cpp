#include <openfw/commands.hpp>

#include <firmware/errors.hpp>
#include <framework/logging.hpp>
#include <framework/meta_tools.hpp>
#include <framework/settings.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace bpo = boost::program_options;

static void PrintUsage(std::ostream& os) {
    os << "Usage: openfw <command> [options]\n\n"
          "Commands:\n"
          "  split <image>           Extract segments and a layout descriptor\n"
          "  build <layout|prefix>   Pack segments into a new firmware image\n"
          "  list <image>            Print the structure of an image\n"
          "  verify <image>          Check all checksums and signatures of an image\n"
          "  wizard                  Interactively split or build (default without arguments)\n\n"
          "Run \"openfw <command> --help\" for the options of a command." << std::endl;
}

/**
 * Parses the arguments following the command name. Returns false if the
 * command should not be run, setting exit_code accordingly.
 */
static bool ParseCommandLine(const std::vector<std::string>& args, const std::string& positional,
                             bpo::options_description& desc, int& exit_code) {
    desc.add_options()
        ("help,h", "Print this help");

    try {
        auto positional_arguments = bpo::positional_options_description{}.add(positional.c_str(), 1);
        bpo::variables_map var_map;
        bpo::store(bpo::command_line_parser(args).options(desc).positional(positional_arguments).run(),
                   var_map);
        if (var_map.count("help")) {
            std::cout << desc << std::endl;
            exit_code = 0;
            return false;
        }

        bpo::notify(var_map);
    } catch (bpo::error& error) {
        std::cerr << "ERROR: " << error.what() << "\n" << desc << std::endl;
        exit_code = 1;
        return false;
    }
    return true;
}

static int RunCommand(const std::string& command, const std::vector<std::string>& args, LogManager& log_manager) {
    std::string input;
    std::string key;
    bool debug = false;
    int exit_code = 0;

    if (command == "split") {
        std::string prefix;

        bpo::options_description desc("split options");
        desc.add_options()
            ("image", bpo::value<std::string>(&input)->required(), "Firmware image to split")
            ("output,o", bpo::value<std::string>(&prefix), "Output path prefix (defaults to the image version)")
            ("key,k", bpo::value<std::string>(&key), "PEM public key to verify the signature block with")
            ("debug,d", bpo::bool_switch(&debug)->default_value(false), "Print per-segment details");
        if (!ParseCommandLine(args, "image", desc, exit_code)) {
            return exit_code;
        }

        Settings::SplitSettings settings;
        settings.set<Settings::InputImage>(input);
        settings.set<Settings::OutputPrefix>(prefix);
        settings.set<Settings::PublicKeyFile>(key);
        settings.set<Settings::DebugLogging>(debug);
        return Commands::Split(settings, log_manager);
    } else if (command == "build") {
        Settings::BuildSettings settings;
        std::string output = settings.get<Settings::OutputImage>();
        std::string version = settings.get<Settings::FirmwareVersion>();
        bool strict = false;

        bpo::options_description desc("build options");
        desc.add_options()
            ("layout", bpo::value<std::string>(&input)->required(), "Layout descriptor (.txt) or segment file prefix")
            ("output,o", bpo::value<std::string>(&output), "Output file")
            ("version,v", bpo::value<std::string>(&version), "Firmware version string")
            ("strict", bpo::bool_switch(&strict)->default_value(false), "Fail on over-long names instead of truncating them")
            ("debug,d", bpo::bool_switch(&debug)->default_value(false), "Print per-segment details");
        if (!ParseCommandLine(args, "layout", desc, exit_code)) {
            return exit_code;
        }

        settings.set<Settings::LayoutSource>(input);
        settings.set<Settings::OutputImage>(output);
        settings.set<Settings::FirmwareVersion>(version);
        settings.set<Settings::StrictFieldWidths>(strict);
        settings.set<Settings::DebugLogging>(debug);
        return Commands::Build(settings, log_manager);
    } else if (command == "list" || command == "verify") {
        bpo::options_description desc(command + " options");
        desc.add_options()
            ("image", bpo::value<std::string>(&input)->required(), "Firmware image")
            ("key,k", bpo::value<std::string>(&key), "PEM public key to verify the signature block with")
            ("debug,d", bpo::bool_switch(&debug)->default_value(false), "Print per-segment details");
        if (!ParseCommandLine(args, "image", desc, exit_code)) {
            return exit_code;
        }

        Settings::InspectSettings settings;
        settings.set<Settings::InputImage>(input);
        settings.set<Settings::PublicKeyFile>(key);
        settings.set<Settings::DebugLogging>(debug);
        return (command == "list") ? Commands::List(settings, log_manager) : Commands::Verify(settings, log_manager);
    } else if (command == "wizard") {
        return Commands::Wizard(std::cin, std::cout, log_manager);
    } else if (command == "--help" || command == "-h" || command == "help") {
        PrintUsage(std::cout);
        return 0;
    }

    std::cerr << "Unknown command \"" << command << "\"\n";
    PrintUsage(std::cerr);
    return 1;
}

int main(int argc, char* argv[]) {
    auto log_manager = Meta::invoke([]() {
        spdlog::sink_ptr logging_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        return std::make_unique<LogManager>(logging_sink);
    });
    auto logger = log_manager->RegisterLogger("CLI");
    log_manager->RegisterLogger("LAYOUT");

    const std::string command = (argc < 2) ? "wizard" : argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    try {
        return RunCommand(command, args, *log_manager);
    } catch (Firmware::FormatError& err) {
        logger->error("Malformed firmware image: {}", err.what());
    } catch (std::exception& err) {
        logger->error("{}", err.what());
    }
    return 1;
}
