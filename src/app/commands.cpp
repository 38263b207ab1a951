/**
 * @file commands.cpp
 * @brief Выполнение команд CLI
 */

#include "commands.hpp"
#include "interactive.hpp"
#include "core/brute_force.hpp"
#include "core/transform.hpp"
#include "core/validator.hpp"
#include "io/brute_force_writer.hpp"
#include "io/file_utils.hpp"
#include "io/text_utils.hpp"
#include <istream>
#include <ostream>
#include <stdexcept>

namespace caesar::app {

namespace {

void checkInputSize(const std::string& text) {
    if (text.size() > cipher_limits::kMaxInputSize) {
        throw std::runtime_error("Input text exceeds maximum size of " +
                                 std::to_string(cipher_limits::kMaxInputSize) + " bytes");
    }
}

void printCheckedResult(std::ostream& out, std::string_view label, const CipherResult& result) {
    if (result.ok()) {
        out << label << ": " << result.value() << "\n";
    } else {
        out << "Error: " << result.error().toString() << "\n";
    }
}

} // namespace

std::string resolveInputText(
    const std::optional<std::string>& text,
    const std::optional<std::filesystem::path>& file,
    std::istream& in,
    std::ostream& out
) {
    if (text.has_value() && file.has_value()) {
        throw std::invalid_argument("Cannot specify both text and file");
    }

    if (text.has_value()) {
        checkInputSize(*text);
        return *text;
    }

    if (file.has_value()) {
        return io::readTextFile(*file, cipher_limits::kMaxInputSize);
    }

    out << "Enter text: " << std::flush;
    std::string line;
    if (!std::getline(in, line) && in.bad()) {
        throw std::runtime_error("Failed to read text from standard input");
    }
    checkInputSize(line);
    return std::string(io::trimWhitespace(line));
}

void outputResult(
    const std::string& result,
    const std::optional<std::filesystem::path>& output_file,
    std::ostream& out
) {
    if (output_file.has_value()) {
        io::atomicWrite(*output_file, result);
        out << "Result written to file: " << output_file->string() << "\n";
    } else {
        out << result << "\n";
    }
}

int runCipherCommand(CommandKind kind, const CipherCommandOptions& options, CommandStreams streams) {
    auto input = resolveInputText(options.text, options.file, streams.in, streams.out);
    const bool encrypting = (kind == CommandKind::Encrypt);

    std::string result;
    if (options.safe) {
        auto checked = encrypting ? core::encryptChecked(input, options.shift)
                                  : core::decryptChecked(input, options.shift);
        if (!checked.ok()) {
            streams.err << "Error: " << checked.error().toString() << "\n";
            return 1;
        }
        result = checked.value();
    } else {
        result = encrypting ? core::encrypt(input, options.shift)
                            : core::decrypt(input, options.shift);
    }

    outputResult(result, options.output, streams.out);
    return 0;
}

int runBruteForceCommand(const BruteForceOptions& options, CommandStreams streams) {
    auto input = resolveInputText(options.text, options.file, streams.in, streams.out);
    auto candidates = core::bruteForce(input);
    if (options.json) {
        io::writeBruteForceJson(streams.out, input, candidates);
    } else {
        io::writeBruteForceText(streams.out, input, candidates);
    }
    return 0;
}

void runDemo(std::ostream& out) {
    out << "=== Caesar Cipher Demo ===\n";
    out << "Run with --help to see CLI options\n\n";

    const std::string text = "I Love You.";
    auto enc_text = core::encrypt(text, 3);

    out << "=== Basic Features ===\n";
    out << "Original: " << text << "\n";
    out << "Encrypted: " << enc_text << "\n";
    out << "Decrypted (encrypt): " << core::encrypt(enc_text, -3) << "\n";
    out << "Decrypted (decrypt): " << core::decrypt(enc_text, 3) << "\n";

    const std::string mixed_text = "Hello World! 123";
    auto encrypted_mixed = core::encrypt(mixed_text, 5);

    out << "\n=== Mixed Case Test ===\n";
    out << "Original: " << mixed_text << "\n";
    out << "Encrypted: " << encrypted_mixed << "\n";
    out << "Decrypted: " << core::decrypt(encrypted_mixed, 5) << "\n";

    out << "\n=== Error Handling Test ===\n";
    printCheckedResult(out, "Valid encryption", core::encryptChecked("Test Message", 3));
    printCheckedResult(out, "Empty text encryption", core::encryptChecked("", 3));
    printCheckedResult(out, "Invalid shift result", core::encryptChecked("Test", 30));

    out << "\n=== CLI Usage Examples ===\n";
    out << "caesar_cipher encrypt --text \"Hello World\" --shift 5\n";
    out << "caesar_cipher decrypt --text \"Mjqqt Btwqi\" --shift 5\n";
    out << "caesar_cipher interactive\n";
    out << "caesar_cipher brute-force --text \"Mjqqt Btwqi\"\n";
    out << "caesar_cipher --help\n";
}

int runCommand(const ParsedCommand& command, std::string_view program_name, CommandStreams streams) {
    switch (command.kind) {
    case CommandKind::Demo:
        runDemo(streams.out);
        return 0;
    case CommandKind::Encrypt:
    case CommandKind::Decrypt:
        return runCipherCommand(command.kind, command.cipher, streams);
    case CommandKind::Interactive:
        runInteractiveMode(streams.in, streams.out);
        return 0;
    case CommandKind::BruteForce:
        return runBruteForceCommand(command.brute_force, streams);
    case CommandKind::Help:
        streams.out << usageText(program_name);
        return 0;
    case CommandKind::Version:
        streams.out << "caesar_cipher " << CAESAR_VERSION << "\n";
        return 0;
    }
    return 1;
}

} // namespace caesar::app
