/**
 * @file test_cli_args.cpp
 * @brief Unit-тесты разбора аргументов и ввода сдвига
 */

#include <doctest/doctest.h>
#include "app/cli_args.hpp"
#include <limits>
#include <stdexcept>
#include <vector>

using namespace caesar::app;

namespace {

ParsedCommand parse(std::vector<const char*> args) {
    args.insert(args.begin(), "caesar_cipher");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("parseCommandLine: без аргументов означает демо") {
    const char* argv[] = {"caesar_cipher"};
    CHECK(parseCommandLine(1, argv).kind == CommandKind::Demo);
}

TEST_CASE("parseCommandLine: encrypt/decrypt") {
    SUBCASE("Все опции") {
        auto cmd = parse({"encrypt", "--text", "Hello", "--shift", "5", "--output", "out.txt", "--safe"});
        CHECK(cmd.kind == CommandKind::Encrypt);
        REQUIRE(cmd.cipher.text.has_value());
        CHECK(*cmd.cipher.text == "Hello");
        CHECK(cmd.cipher.shift == 5);
        REQUIRE(cmd.cipher.output.has_value());
        CHECK(cmd.cipher.output->string() == "out.txt");
        CHECK(cmd.cipher.safe);
        CHECK_FALSE(cmd.cipher.file.has_value());
    }

    SUBCASE("Короткие опции и сдвиг по умолчанию") {
        auto cmd = parse({"decrypt", "-f", "in.txt"});
        CHECK(cmd.kind == CommandKind::Decrypt);
        CHECK(cmd.cipher.shift == 3);
        REQUIRE(cmd.cipher.file.has_value());
        CHECK(cmd.cipher.file->string() == "in.txt");
        CHECK_FALSE(cmd.cipher.safe);
    }

    SUBCASE("Отрицательный и крайний сдвиг") {
        CHECK(parse({"encrypt", "-s", "-7"}).cipher.shift == -7);
        CHECK(parse({"encrypt", "-s", "+7"}).cipher.shift == 7);
        CHECK(parse({"encrypt", "-s", "-2147483648"}).cipher.shift == std::numeric_limits<int>::min());
    }
}

TEST_CASE("parseCommandLine: длинные опции со значением через '='") {
    auto cmd = parse({"encrypt", "--text=Hello, World", "--shift=5", "--output=out.txt"});
    REQUIRE(cmd.cipher.text.has_value());
    CHECK(*cmd.cipher.text == "Hello, World");
    CHECK(cmd.cipher.shift == 5);
    REQUIRE(cmd.cipher.output.has_value());
    CHECK(cmd.cipher.output->string() == "out.txt");

    CHECK(parse({"decrypt", "--shift=-30"}).cipher.shift == -30);
    CHECK(*parse({"encrypt", "--text=a=b"}).cipher.text == "a=b");
    CHECK(*parse({"encrypt", "--text="}).cipher.text == "");

    auto bf = parse({"brute-force", "--file=secret.txt"});
    REQUIRE(bf.brute_force.file.has_value());
    CHECK(bf.brute_force.file->string() == "secret.txt");

    CHECK_THROWS_AS(parse({"encrypt", "--shift=abc"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"encrypt", "--safe=yes"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"brute-force", "--json=1"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"encrypt", "--bogus=1"}), std::invalid_argument);
}

TEST_CASE("parseCommandLine: ошибки") {
    CHECK_THROWS_AS(parse({"encrypt", "--shift"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"encrypt", "--shift", "abc"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"encrypt", "--shift", "2147483648"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"encrypt", "--unknown"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"frobnicate"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"diagnostics"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"interactive", "--text", "x"}), std::invalid_argument);
}

TEST_CASE("parseCommandLine: остальные команды") {
    CHECK(parse({"interactive"}).kind == CommandKind::Interactive);
    CHECK(parse({"--help"}).kind == CommandKind::Help);
    CHECK(parse({"--version"}).kind == CommandKind::Version);

    auto bf = parse({"brute-force", "-t", "Khoor", "--json"});
    CHECK(bf.kind == CommandKind::BruteForce);
    REQUIRE(bf.brute_force.text.has_value());
    CHECK(*bf.brute_force.text == "Khoor");
    CHECK(bf.brute_force.json);
}

TEST_CASE("parseShiftArgument") {
    CHECK(parseShiftArgument("0") == 0);
    CHECK(parseShiftArgument("-25") == -25);
    CHECK(parseShiftArgument("2147483647") == std::numeric_limits<int>::max());
    CHECK_THROWS_AS((void)parseShiftArgument(""), std::invalid_argument);
    CHECK_THROWS_AS((void)parseShiftArgument("3.5"), std::invalid_argument);
    CHECK_THROWS_AS((void)parseShiftArgument("+-3"), std::invalid_argument);
    CHECK_THROWS_AS((void)parseShiftArgument(" 3"), std::invalid_argument);
}

TEST_CASE("validateShiftInput") {
    SUBCASE("Допустимые значения без предупреждения") {
        for (const char* input : {"3", "0", "25", "-25", " 5 ", "7\n"}) {
            INFO("input = '" << input << "'");
            auto result = validateShiftInput(input);
            CHECK_FALSE(result.warning.has_value());
        }
        CHECK(validateShiftInput("25").shift == 25);
        CHECK(validateShiftInput("-25").shift == -25);
        CHECK(validateShiftInput(" 5 ").shift == 5);
    }

    SUBCASE("Пустой ввод даёт сдвиг по умолчанию") {
        CHECK(validateShiftInput("").shift == 3);
        CHECK_FALSE(validateShiftInput("").warning.has_value());
        CHECK(validateShiftInput("   ").shift == 3);
        CHECK_FALSE(validateShiftInput("   ").warning.has_value());
    }

    SUBCASE("Вне диапазона значение сохраняется, выдаётся предупреждение") {
        for (int value : {26, -26, 9999}) {
            auto result = validateShiftInput(std::to_string(value));
            CHECK(result.shift == value);
            REQUIRE(result.warning.has_value());
            CHECK(result.warning->find("Warning") != std::string::npos);
            CHECK(result.warning->find(std::to_string(value)) != std::string::npos);
        }
    }

    SUBCASE("Не число даёт сдвиг по умолчанию с предупреждением") {
        auto result = validateShiftInput("abc");
        CHECK(result.shift == 3);
        REQUIRE(result.warning.has_value());
        CHECK(*result.warning == "Invalid shift value, using default (3)");
    }
}

TEST_CASE("usageText перечисляет команды") {
    auto usage = usageText("caesar_cipher");
    for (const char* name : {"encrypt", "decrypt", "interactive", "brute-force", "--safe"}) {
        INFO(name);
        CHECK(usage.find(name) != std::string::npos);
    }
}
