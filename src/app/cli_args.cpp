/**
 * @file cli_args.cpp
 * @brief Разбор аргументов командной строки
 */

#include "cli_args.hpp"
#include "core/shift_math.hpp"
#include "io/text_utils.hpp"
#include <charconv>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace caesar::app {

namespace {

bool tryParseShift(std::string_view value, ShiftAmount& result) {
    if (!value.empty() && value.front() == '+') {
        value.remove_prefix(1);
        if (!value.empty() && value.front() == '-') {
            return false;
        }
    }
    if (value.empty()) {
        return false;
    }

    ShiftAmount parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return false;
    }
    result = parsed;
    return true;
}

/**
 * @brief Аргумент командной строки, разбитый на имя опции и значение
 *
 * Длинная опция может нести значение после '=': --shift=5.
 */
struct OptionArg {
    std::string_view name;
    std::optional<std::string_view> inline_value;
};

OptionArg splitOption(std::string_view arg) {
    if (arg.size() > 2 && arg.substr(0, 2) == "--") {
        auto eq = arg.find('=');
        if (eq != std::string_view::npos) {
            return {arg.substr(0, eq), arg.substr(eq + 1)};
        }
    }
    return {arg, std::nullopt};
}

/// Значение опции: после '=' либо следующий аргумент, иначе ошибка
std::string_view requireValue(int argc, const char* const argv[], int& i, const OptionArg& option) {
    if (option.inline_value.has_value()) {
        return *option.inline_value;
    }
    if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for option " + std::string(option.name));
    }
    return argv[++i];
}

void requireFlag(const OptionArg& option) {
    if (option.inline_value.has_value()) {
        throw std::invalid_argument("Option " + std::string(option.name) + " does not take a value");
    }
}

void parseCipherOptions(int argc, const char* const argv[], CipherCommandOptions& options) {
    for (int i = 2; i < argc; ++i) {
        auto opt = splitOption(argv[i]);
        if (opt.name == "-t" || opt.name == "--text") {
            options.text = std::string(requireValue(argc, argv, i, opt));
        } else if (opt.name == "-f" || opt.name == "--file") {
            options.file = std::filesystem::path(requireValue(argc, argv, i, opt));
        } else if (opt.name == "-s" || opt.name == "--shift") {
            options.shift = parseShiftArgument(requireValue(argc, argv, i, opt));
        } else if (opt.name == "-o" || opt.name == "--output") {
            options.output = std::filesystem::path(requireValue(argc, argv, i, opt));
        } else if (opt.name == "--safe") {
            requireFlag(opt);
            options.safe = true;
        } else {
            throw std::invalid_argument("Unknown option: " + std::string(argv[i]));
        }
    }
}

void parseBruteForceOptions(int argc, const char* const argv[], BruteForceOptions& options) {
    for (int i = 2; i < argc; ++i) {
        auto opt = splitOption(argv[i]);
        if (opt.name == "-t" || opt.name == "--text") {
            options.text = std::string(requireValue(argc, argv, i, opt));
        } else if (opt.name == "-f" || opt.name == "--file") {
            options.file = std::filesystem::path(requireValue(argc, argv, i, opt));
        } else if (opt.name == "--json") {
            requireFlag(opt);
            options.json = true;
        } else {
            throw std::invalid_argument("Unknown option: " + std::string(argv[i]));
        }
    }
}

} // namespace

ShiftAmount parseShiftArgument(std::string_view value) {
    ShiftAmount shift = 0;
    if (!tryParseShift(value, shift)) {
        throw std::invalid_argument("Invalid shift value '" + std::string(value) +
                                    "' (integer required)");
    }
    return shift;
}

ParsedCommand parseCommandLine(int argc, const char* const argv[]) {
    ParsedCommand command;
    if (argc <= 1) {
        command.kind = CommandKind::Demo;
        return command;
    }

    std::string_view name(argv[1]);
    if (name == "encrypt" || name == "decrypt") {
        command.kind = (name == "encrypt") ? CommandKind::Encrypt : CommandKind::Decrypt;
        parseCipherOptions(argc, argv, command.cipher);
    } else if (name == "interactive") {
        if (argc > 2) {
            throw std::invalid_argument("Unknown option: " + std::string(argv[2]));
        }
        command.kind = CommandKind::Interactive;
    } else if (name == "brute-force") {
        command.kind = CommandKind::BruteForce;
        parseBruteForceOptions(argc, argv, command.brute_force);
    } else if (name == "-h" || name == "--help" || name == "help") {
        command.kind = CommandKind::Help;
    } else if (name == "-V" || name == "--version") {
        command.kind = CommandKind::Version;
    } else {
        throw std::invalid_argument("Unknown command: " + std::string(name));
    }

    return command;
}

ShiftInput validateShiftInput(std::string_view input) {
    ShiftInput result;
    auto trimmed = io::trimWhitespace(input);
    if (trimmed.empty()) {
        return result;
    }

    ShiftAmount shift = 0;
    if (!tryParseShift(trimmed, shift)) {
        result.warning = "Invalid shift value, using default (" +
                         std::to_string(cipher_limits::kDefaultShift) + ")";
        return result;
    }

    result.shift = shift;
    if (!core::isShiftInRange(shift)) {
        result.warning = "Warning: shift " + std::to_string(shift) +
                         " is outside the typical range (" +
                         std::to_string(cipher_limits::kMinShift) + " to " +
                         std::to_string(cipher_limits::kMaxShift) +
                         "). Value will be normalized.";
    }
    return result;
}

std::string usageText(std::string_view program_name) {
    std::ostringstream out;
    out << "A Caesar cipher encryption/decryption tool\n\n"
        << "Usage: " << program_name << " <COMMAND> [OPTIONS]\n\n"
        << "Commands:\n"
        << "  encrypt       Encrypt text using Caesar cipher\n"
        << "  decrypt       Decrypt text using Caesar cipher\n"
        << "  interactive   Interactive mode\n"
        << "  brute-force   Show all possible decryptions (brute force)\n\n"
        << "Options for encrypt/decrypt:\n"
        << "  -t, --text <TEXT>     Text to process\n"
        << "  -f, --file <FILE>     Input file path\n"
        << "  -s, --shift <SHIFT>   Shift value (any integer; safe mode: "
        << cipher_limits::kMinShift << " to " << cipher_limits::kMaxShift
        << ", default: " << cipher_limits::kDefaultShift << ")\n"
        << "  -o, --output <FILE>   Output file path\n"
        << "      --safe            Use safe mode with error checking\n\n"
        << "Options for brute-force:\n"
        << "  -t, --text <TEXT>     Text to decrypt\n"
        << "  -f, --file <FILE>     Input file path\n"
        << "      --json            Print candidates as JSON\n\n"
        << "  -h, --help            Print help\n"
        << "  -V, --version         Print version\n";
    return out.str();
}

} // namespace caesar::app
