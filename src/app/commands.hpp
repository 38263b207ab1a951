/**
 * @file commands.hpp
 * @brief Выполнение команд CLI
 *
 * Все функции работают с переданными потоками, а не напрямую
 * с std::cin/std::cout, чтобы их можно было вызывать из тестов.
 */

#pragma once

#include "cli_args.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace caesar::app {

/**
 * @brief Потоки ввода-вывода команды
 */
struct CommandStreams {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

/**
 * @brief Получить входной текст
 *
 * Приоритет: --text, затем --file, иначе строка из in после
 * приглашения «Enter text: » (с обрезкой пробелов).
 *
 * @throws std::invalid_argument если заданы и текст, и файл
 * @throws std::runtime_error при ошибке чтения или превышении kMaxInputSize
 */
[[nodiscard]] std::string resolveInputText(
    const std::optional<std::string>& text,
    const std::optional<std::filesystem::path>& file,
    std::istream& in,
    std::ostream& out
);

/**
 * @brief Вывести результат в файл (если задан) или в out
 */
void outputResult(
    const std::string& result,
    const std::optional<std::filesystem::path>& output_file,
    std::ostream& out
);

/**
 * @brief encrypt / decrypt
 * @return Код завершения
 */
int runCipherCommand(CommandKind kind, const CipherCommandOptions& options, CommandStreams streams);

int runBruteForceCommand(const BruteForceOptions& options, CommandStreams streams);

/**
 * @brief Демонстрация возможностей (запуск без аргументов)
 */
void runDemo(std::ostream& out);

/**
 * @brief Выполнить разобранную команду
 *
 * Исключения слоёв io/app пробрасываются вызывающему (main).
 */
int runCommand(const ParsedCommand& command, std::string_view program_name, CommandStreams streams);

} // namespace caesar::app
