/**
 * @file main.cpp
 * @brief Точка входа приложения caesar_cipher
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "cli_args.hpp"
#include "commands.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        auto command = caesar::app::parseCommandLine(argc, argv);
        std::string_view program_name = (argc > 0) ? argv[0] : "caesar_cipher";
        return caesar::app::runCommand(command, program_name, {std::cin, std::cout, std::cerr});
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
