/**
 * @file validator.hpp
 * @brief Проверяемые варианты шифрования
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * В отличие от encrypt/decrypt, не нормализуют молча сдвиг вне
 * [-25, 25], а возвращают типизированную ошибку.
 */

#pragma once

#include "model/cipher_config.hpp"
#include "model/cipher_error.hpp"
#include <optional>
#include <string_view>

namespace caesar::core {

using namespace caesar::model;

/**
 * @brief Проверка предусловий
 *
 * Порядок проверок: сначала пустой текст, затем диапазон сдвига.
 *
 * @return Ошибка или nullopt, если вход корректен
 */
[[nodiscard]] std::optional<CipherError> validateCipherInput(
    std::string_view text,
    ShiftAmount shift
);

/**
 * @brief Шифрование с проверкой входа
 *
 * @return Зашифрованный текст, либо EmptyInput / InvalidShift
 */
[[nodiscard]] CipherResult encryptChecked(std::string_view text, ShiftAmount shift);

/**
 * @brief Дешифрование с проверкой входа
 *
 * Проверяется исходное значение shift, в сообщении об ошибке
 * фигурирует именно оно.
 */
[[nodiscard]] CipherResult decryptChecked(std::string_view text, ShiftAmount shift);

} // namespace caesar::core
