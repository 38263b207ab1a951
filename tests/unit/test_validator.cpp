/**
 * @file test_validator.cpp
 * @brief Unit-тесты проверяемых вариантов шифрования
 */

#include <doctest/doctest.h>
#include "core/validator.hpp"
#include <limits>
#include <string>

using namespace caesar::core;
using namespace caesar::model;

TEST_CASE("encryptChecked: корректный вход") {
    auto result = encryptChecked("Hello", 3);
    REQUIRE(result.ok());
    CHECK(result.value() == "Khoor");

    CHECK(encryptChecked("Test", 25).value() == "Sdrs");
    CHECK(encryptChecked("Test", -25).value() == "Uftu");
    CHECK(encryptChecked("A", 0).value() == "A");
}

TEST_CASE("encryptChecked: пустой текст") {
    auto result = encryptChecked("", 3);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().kind == CipherErrorKind::EmptyInput);
    CHECK(result.error().message.empty());
    CHECK(result.error().toString() == "Input text cannot be empty");
}

TEST_CASE("encryptChecked: сдвиг вне диапазона") {
    SUBCASE("26") {
        auto result = encryptChecked("Test", 26);
        REQUIRE(result.hasError(CipherErrorKind::InvalidShift));
        CHECK(result.error().message.find("26") != std::string::npos);
        CHECK(result.error().message.find("25") != std::string::npos);
    }

    SUBCASE("-26 и 100") {
        CHECK(encryptChecked("Test", -26).hasError(CipherErrorKind::InvalidShift));
        CHECK(encryptChecked("Test", 100).hasError(CipherErrorKind::InvalidShift));
    }

    SUBCASE("Текст сообщения") {
        auto result = encryptChecked("Test", 30);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().message == "Shift value 30 is out of range (-25 to 25)");
        CHECK(result.error().toString() == "Invalid shift value: Shift value 30 is out of range (-25 to 25)");
    }
}

TEST_CASE("Граница диапазона сдвига") {
    CHECK(encryptChecked("A", 25).ok());
    CHECK(encryptChecked("A", -25).ok());
    CHECK(encryptChecked("A", 26).hasError(CipherErrorKind::InvalidShift));
    CHECK(encryptChecked("A", -26).hasError(CipherErrorKind::InvalidShift));
}

TEST_CASE("Пустой текст проверяется раньше сдвига") {
    CHECK(encryptChecked("", 9999).hasError(CipherErrorKind::EmptyInput));
    CHECK(decryptChecked("", 9999).hasError(CipherErrorKind::EmptyInput));
    CHECK(encryptChecked("", std::numeric_limits<ShiftAmount>::min()).hasError(CipherErrorKind::EmptyInput));
    CHECK(decryptChecked("", std::numeric_limits<ShiftAmount>::max()).hasError(CipherErrorKind::EmptyInput));
}

TEST_CASE("decryptChecked") {
    CHECK(decryptChecked("Khoor", 3).value() == "Hello");
    CHECK(decryptChecked("Z", 25).value() == "A");
    CHECK(decryptChecked("A", -25).value() == "Z");
    CHECK(decryptChecked("Hello World", 0).value() == "Hello World");
    CHECK(decryptChecked("", 3).hasError(CipherErrorKind::EmptyInput));
    CHECK(decryptChecked("Test", 26).hasError(CipherErrorKind::InvalidShift));
    CHECK(decryptChecked("Test", -26).hasError(CipherErrorKind::InvalidShift));
}

TEST_CASE("Крайние значения в проверяемых вариантах") {
    constexpr auto kMin = std::numeric_limits<ShiftAmount>::min();
    constexpr auto kMax = std::numeric_limits<ShiftAmount>::max();

    for (auto shift : {kMin, kMax}) {
        INFO("shift = " << shift);
        auto enc = encryptChecked("Test", shift);
        auto dec = decryptChecked("Test", shift);
        REQUIRE(enc.hasError(CipherErrorKind::InvalidShift));
        REQUIRE(dec.hasError(CipherErrorKind::InvalidShift));

        // В сообщении исходное значение, а не его отрицание
        CHECK(enc.error().toString().find(std::to_string(shift)) != std::string::npos);
        CHECK(dec.error().toString().find(std::to_string(shift)) != std::string::npos);
    }
}

TEST_CASE("Обратимость для всех допустимых сдвигов") {
    const std::string original = "TestOverflow";
    for (ShiftAmount shift = -25; shift <= 25; ++shift) {
        INFO("shift = " << shift);
        auto encrypted = encryptChecked(original, shift);
        REQUIRE(encrypted.ok());
        auto decrypted = decryptChecked(encrypted.value(), shift);
        REQUIRE(decrypted.ok());
        CHECK(decrypted.value() == original);
    }
}

TEST_CASE("validateCipherInput") {
    CHECK_FALSE(validateCipherInput("x", 0).has_value());
    REQUIRE(validateCipherInput("", 0).has_value());
    CHECK(validateCipherInput("", 0)->kind == CipherErrorKind::EmptyInput);
    CHECK(validateCipherInput("x", -100)->kind == CipherErrorKind::InvalidShift);
}

TEST_CASE("CipherError: сравнение и имя вида") {
    CHECK(CipherError::emptyInput() == CipherError::emptyInput());
    CHECK_FALSE(CipherError::invalidShift("a") == CipherError::invalidShift("b"));
    CHECK(cipherErrorKindToString(CipherErrorKind::EmptyInput) == "EmptyInput");
    CHECK(cipherErrorKindToString(CipherErrorKind::InvalidShift) == "InvalidShift");
}
