/**
 * @file interactive.cpp
 * @brief Интерактивный режим
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "interactive.hpp"
#include "cli_args.hpp"
#include "core/brute_force.hpp"
#include "core/transform.hpp"
#include "io/brute_force_writer.hpp"
#include "io/text_utils.hpp"
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace caesar::app {

namespace {

/// Приглашение и строка ответа; nullopt при конце потока
std::optional<std::string> promptForText(std::istream& in, std::ostream& out, std::string_view prompt) {
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    return std::string(io::trimWhitespace(line));
}

std::optional<ShiftAmount> promptForShift(std::istream& in, std::ostream& out) {
    out << "Enter shift value (default: " << cipher_limits::kDefaultShift << "): " << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }

    auto input = validateShiftInput(line);
    if (input.warning.has_value()) {
        out << *input.warning << "\n";
    }
    return input.shift;
}

} // namespace

void runInteractiveMode(std::istream& in, std::ostream& out) {
    out << "=== Caesar Cipher Interactive Mode ===\n";
    out << "Type 'quit' to exit\n";

    while (true) {
        auto choice = promptForText(in, out, "\nChoose operation (e)ncrypt, (d)ecrypt, (b)rute force, or (q)uit: ");
        if (!choice) {
            out << "\n";
            break;
        }
        auto op = io::asciiToLower(*choice);

        if (op == "e" || op == "encrypt" || op == "d" || op == "decrypt") {
            const bool encrypting = (op == "e" || op == "encrypt");
            auto text = promptForText(in, out, encrypting ? "Enter text to encrypt: " : "Enter text to decrypt: ");
            if (!text) break;
            auto shift = promptForShift(in, out);
            if (!shift) break;

            if (encrypting) {
                out << "Encrypted: " << core::encrypt(*text, *shift) << "\n";
            } else {
                out << "Decrypted: " << core::decrypt(*text, *shift) << "\n";
            }
        } else if (op == "b" || op == "brute" || op == "bruteforce") {
            auto text = promptForText(in, out, "Enter text to brute force decrypt: ");
            if (!text) break;
            io::writeBruteForceText(out, *text, core::bruteForce(*text));
        } else if (op == "q" || op == "quit") {
            out << "Goodbye!\n";
            break;
        } else {
            out << "Invalid option. Please choose e, d, b, or q.\n";
        }
    }
}

} // namespace caesar::app
