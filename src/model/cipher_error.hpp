/**
 * @file cipher_error.hpp
 * @brief Ошибки проверяемых операций шифрования
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace caesar::model {

/**
 * @brief Вид ошибки шифрования
 */
enum class CipherErrorKind {
    EmptyInput,     ///< Пустой входной текст
    InvalidShift    ///< Сдвиг вне диапазона [-25, 25]
};

/**
 * @brief Ошибка проверяемой операции
 *
 * Для EmptyInput поле message пустое, для InvalidShift содержит
 * значение сдвига и допустимую границу.
 */
struct CipherError {
    CipherErrorKind kind = CipherErrorKind::EmptyInput;
    std::string message;

    [[nodiscard]] static CipherError emptyInput() {
        return {CipherErrorKind::EmptyInput, {}};
    }

    [[nodiscard]] static CipherError invalidShift(std::string detail) {
        return {CipherErrorKind::InvalidShift, std::move(detail)};
    }

    [[nodiscard]] std::string toString() const {
        switch (kind) {
        case CipherErrorKind::EmptyInput: return "Input text cannot be empty";
        case CipherErrorKind::InvalidShift: return "Invalid shift value: " + message;
        }
        return message;
    }

    bool operator==(const CipherError& other) const = default;
};

[[nodiscard]] inline std::string_view cipherErrorKindToString(CipherErrorKind kind) noexcept {
    switch (kind) {
    case CipherErrorKind::EmptyInput: return "EmptyInput";
    case CipherErrorKind::InvalidShift: return "InvalidShift";
    }
    return "Unknown";
}

/**
 * @brief Результат проверяемой операции: текст либо ошибка
 */
class CipherResult {
public:
    CipherResult(std::string text) : value_(std::move(text)) {}
    CipherResult(CipherError error) : value_(std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<std::string>(value_);
    }

    explicit operator bool() const noexcept { return ok(); }

    /// Текст результата; при ошибке бросает std::bad_variant_access
    [[nodiscard]] const std::string& value() const { return std::get<std::string>(value_); }

    /// Ошибка; при успехе бросает std::bad_variant_access
    [[nodiscard]] const CipherError& error() const { return std::get<CipherError>(value_); }

    [[nodiscard]] bool hasError(CipherErrorKind kind) const noexcept {
        const auto* err = std::get_if<CipherError>(&value_);
        return err != nullptr && err->kind == kind;
    }

private:
    std::variant<std::string, CipherError> value_;
};

} // namespace caesar::model
