#include "cli/cli.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "engine/resolver.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace macroenv::cli {

namespace {

void print_usage(std::ostream& err, const char* program) {
    err << "Usage: " << program << " [options] NAME\n";
    err << "\nResolve NAME from the .env file, the environment or the terminal.\n";
    err << "\nOptions:\n";
    err << "  -s, --source SRC   file | system | input | all (default: all)\n";
    err << "  -f, --file PATH    Read this key-value file instead of searching for one\n";
    err << "  --strict           Fail on malformed lines in the key-value file\n";
    err << "  --unquote          Strip surrounding quotes from file values\n";
    err << "  --json             Print the result as JSON\n";
    err << "  -v, --verbose      Enable debug logging\n";
    err << "  -h, --help         Show this help\n";
}

} // namespace

int run(int argc, const char* const argv[], std::istream& in, std::ostream& out, std::ostream& err) {
    const char* program = argc > 0 ? argv[0] : "macroenv";
    auto options = core::config::options_from_env();
    engine::SearchType search = engine::SearchType::ALL;
    bool json_output = false;
    std::string name;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(err, program);
            return EXIT_RESOLVED;
        } else if ((arg == "-s" || arg == "--source") && i + 1 < argc) {
            auto parsed = engine::search_type_from_string(argv[++i]);
            if (!parsed) {
                err << "Unknown source: " << argv[i] << "\n";
                return EXIT_USAGE;
            }
            search = *parsed;
        } else if ((arg == "-f" || arg == "--file") && i + 1 < argc) {
            options.file_path = argv[++i];
        } else if (arg == "--strict") {
            options.parse_mode = core::config::ParseMode::STRICT;
        } else if (arg == "--unquote") {
            options.unquote_values = true;
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "-v" || arg == "--verbose") {
            core::set_log_level(spdlog::level::debug);
        } else if (!arg.empty() && arg[0] == '-') {
            err << "Unknown option: " << arg << "\n";
            print_usage(err, program);
            return EXIT_USAGE;
        } else if (name.empty()) {
            name = arg;
        } else {
            err << "Unexpected argument: " << arg << "\n";
            return EXIT_USAGE;
        }
    }

    if (name.empty()) {
        print_usage(err, program);
        return EXIT_USAGE;
    }

    // out carries the value, so the prompt goes to err
    engine::Resolver resolver(
        backends::FileBackend(options),
        backends::SystemBackend(),
        backends::InputBackend(in, err, options.prompt));

    core::logger()->debug("Resolving {} (source={}, parse={})", name,
                          engine::search_type_to_string(search),
                          core::config::parse_mode_to_string(options.parse_mode));

    engine::ResolutionResult result;
    try {
        result = resolver.resolve(search, name);
    } catch (const std::exception& e) {
        core::logger()->error("Failed to resolve {}: {}", name, e.what());
        return EXIT_UNRESOLVED;
    }

    if (json_output) {
        out << engine::to_json(result).dump(2) << std::endl;
    } else if (result.success) {
        out << result.value << std::endl;
    } else {
        core::logger()->error("{}", result.describe());
    }

    return result.success ? EXIT_RESOLVED : EXIT_UNRESOLVED;
}

} // namespace macroenv::cli
