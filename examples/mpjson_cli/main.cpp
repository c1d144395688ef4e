/// mpjson: command-line front end for the two conversions.
/// Usage: ./mpjson to-msgpack [--hex] [input]
///        ./mpjson to-json [--indent N] [--binary reject|base64|bytes] [--keys reject|stringify] [input]
/// Reads the input from the last argument, or from stdin when it is absent.

#include <mpjson/mpjson.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <to-msgpack|to-json> [options] [input]\n"
              << "Options:\n"
              << "  --hex                       emit hex instead of base64 (to-msgpack)\n"
              << "  --indent N                  JSON indentation, -1 for one line (to-json)\n"
              << "  --binary reject|base64|bytes  handling of MessagePack bin values\n"
              << "  --keys reject|stringify     handling of non-string map keys\n"
              << "  --verbose                   debug logging on stderr\n";
}

std::string read_stdin() {
    std::string text{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    // Shells and editors append a newline that is not part of the payload
    if (!text.empty() && text.back() == '\n') text.pop_back();
    if (!text.empty() && text.back() == '\r') text.pop_back();
    return text;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    spdlog::set_default_logger(spdlog::stderr_color_mt("mpjson"));
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);

    const std::string command = argv[1];
    if (command != "to-msgpack" && command != "to-json") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 2;
    }

    mpjson::Converter::Options opts;
    std::optional<std::string> input;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
                return argv[++i];
            };
            if (arg == "--hex") {
                opts.output_encoding = mpjson::Encoding::Hex;
            } else if (arg == "--indent") {
                opts.indent = std::stoi(next());
            } else if (arg == "--binary") {
                opts.decode.binary = mpjson::binary_policy_from_string(next());
            } else if (arg == "--keys") {
                opts.decode.keys = mpjson::key_policy_from_string(next());
            } else if (arg == "--verbose") {
                spdlog::set_level(spdlog::level::debug);
            } else if (arg == "-") {
                // explicit stdin
            } else if (!input && arg.rfind("--", 0) != 0) {
                input = arg;
            } else {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    if (!input) input = read_stdin();
    spdlog::debug("{}: {} bytes of input", command, input->size());

    mpjson::Converter converter{opts};
    mpjson::ConversionResult result = command == "to-msgpack"
        ? converter.json_to_messagepack(*input)
        : converter.messagepack_to_json(*input);

    if (!result.ok()) {
        std::cerr << result.error->message << "\n";
        return 1;
    }
    std::cout << *result.value << "\n";
    return 0;
}
