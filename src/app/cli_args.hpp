/**
 * @file cli_args.hpp
 * @brief Разбор аргументов командной строки
 */

#pragma once

#include "model/cipher_config.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace caesar::app {

using namespace caesar::model;

/**
 * @brief Команда CLI
 */
enum class CommandKind {
    Demo,           ///< Без аргументов: демонстрация возможностей
    Encrypt,        ///< encrypt
    Decrypt,        ///< decrypt
    Interactive,    ///< interactive
    BruteForce,     ///< brute-force
    Help,           ///< --help
    Version         ///< --version
};

/**
 * @brief Опции encrypt/decrypt
 */
struct CipherCommandOptions {
    std::optional<std::string> text;                 ///< --text
    std::optional<std::filesystem::path> file;       ///< --file
    std::optional<std::filesystem::path> output;     ///< --output
    ShiftAmount shift = cipher_limits::kDefaultShift; ///< --shift
    bool safe = false;                               ///< --safe: проверяемый вариант
};

/**
 * @brief Опции brute-force
 */
struct BruteForceOptions {
    std::optional<std::string> text;
    std::optional<std::filesystem::path> file;
    bool json = false;                               ///< --json
};

struct ParsedCommand {
    CommandKind kind = CommandKind::Demo;
    CipherCommandOptions cipher;
    BruteForceOptions brute_force;
};

/**
 * @brief Разобрать argv
 *
 * @throws std::invalid_argument при неизвестной команде/опции,
 *         отсутствующем значении или некорректном сдвиге
 */
[[nodiscard]] ParsedCommand parseCommandLine(int argc, const char* const argv[]);

/**
 * @brief Разобрать значение --shift
 *
 * Допускается знак '+' или '-'; значение должно целиком помещаться в ShiftAmount.
 *
 * @throws std::invalid_argument
 */
[[nodiscard]] ShiftAmount parseShiftArgument(std::string_view value);

/**
 * @brief Результат разбора сдвига, введённого в интерактивном режиме
 */
struct ShiftInput {
    ShiftAmount shift = cipher_limits::kDefaultShift;
    std::optional<std::string> warning;
};

/**
 * @brief Разбор сдвига из строки пользователя с откатом к значению по умолчанию
 *
 * - пустая строка: сдвиг по умолчанию без предупреждения;
 * - не число: сдвиг по умолчанию с предупреждением;
 * - число вне [-25, 25]: принимается, но с предупреждением о нормализации.
 */
[[nodiscard]] ShiftInput validateShiftInput(std::string_view input);

/**
 * @brief Справка по использованию
 */
[[nodiscard]] std::string usageText(std::string_view program_name);

} // namespace caesar::app
