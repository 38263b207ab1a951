/**
 * @file interactive.hpp
 * @brief Интерактивный режим
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <iosfwd>

namespace caesar::app {

/**
 * @brief Цикл «выбор операции, ввод текста, ввод сдвига»
 *
 * Операции: (e)ncrypt, (d)ecrypt, (b)rute force, (q)uit.
 * Завершается по quit или по концу входного потока.
 */
void runInteractiveMode(std::istream& in, std::ostream& out);

} // namespace caesar::app
