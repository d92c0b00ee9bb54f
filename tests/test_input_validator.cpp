#include <gtest/gtest.h>
#include "verifier/input_validator.hpp"

using namespace zk_insurance;

// Every age in range is accepted as-is
TEST(InputValidatorTest, AcceptsWholeAgeRange) {
    for (int age = 10; age <= 25; ++age) {
        auto result = validate(std::to_string(age), FieldKind::Age);
        ASSERT_TRUE(result.ok()) << "age " << age;
        EXPECT_EQ(result.value(), age);
    }
}

TEST(InputValidatorTest, AcceptsWholeBmiRange) {
    for (int bmi = 185; bmi <= 249; ++bmi) {
        auto result = validate(std::to_string(bmi), FieldKind::BmiTimesTen);
        ASSERT_TRUE(result.ok()) << "bmi " << bmi;
        EXPECT_EQ(result.value(), bmi);
    }
}

TEST(InputValidatorTest, AgeOutOfRange) {
    for (const char* raw : {"9", "26", "-5", "0", "100"}) {
        auto result = validate(raw, FieldKind::Age);
        ASSERT_FALSE(result.ok()) << raw;
        EXPECT_EQ(result.error().kind, ValidationErrorKind::OutOfRange) << raw;
        EXPECT_EQ(result.error().min, 10);
        EXPECT_EQ(result.error().max, 25);
    }
}

TEST(InputValidatorTest, BmiOutOfRange) {
    for (const char* raw : {"184", "250", "22", "-200"}) {
        auto result = validate(raw, FieldKind::BmiTimesTen);
        ASSERT_FALSE(result.ok()) << raw;
        EXPECT_EQ(result.error().kind, ValidationErrorKind::OutOfRange) << raw;
    }
}

TEST(InputValidatorTest, RejectsNonNumbers) {
    for (const char* raw : {"abc", "20abc", "2 0", "20.5", "+20", "-", "0x14", "twenty"}) {
        auto result = validate(raw, FieldKind::Age);
        ASSERT_FALSE(result.ok()) << raw;
        EXPECT_EQ(result.error().kind, ValidationErrorKind::NotANumber) << raw;
    }
}

TEST(InputValidatorTest, TrimsSurroundingWhitespace) {
    auto result = validate("  20\t", FieldKind::Age);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 20);
}

TEST(InputValidatorTest, EmptyIsNotANumber) {
    auto result = validate("   ", FieldKind::Age);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ValidationErrorKind::NotANumber);
}

// Too many digits for int64 is a range problem, not a parse problem
TEST(InputValidatorTest, HugeNumberIsOutOfRange) {
    auto result = validate("99999999999999999999999", FieldKind::BmiTimesTen);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ValidationErrorKind::OutOfRange);
}

TEST(InputValidatorTest, ErrorMessages) {
    EXPECT_EQ(validate("abc", FieldKind::Age).error().message(),
              "Invalid input: please enter a whole number.");
    EXPECT_EQ(validate("5", FieldKind::Age).error().message(),
              "Age must be between 10 and 25.");
    EXPECT_EQ(validate("300", FieldKind::BmiTimesTen).error().message(),
              "BMI multiplied by 10 must be between 185 and 249.");
}

TEST(VerificationInputTest, CreateEnforcesBothRanges) {
    EXPECT_TRUE(VerificationInput::create(10, 185).has_value());
    EXPECT_TRUE(VerificationInput::create(25, 249).has_value());
    EXPECT_FALSE(VerificationInput::create(9, 220).has_value());
    EXPECT_FALSE(VerificationInput::create(20, 250).has_value());

    auto input = VerificationInput::create(20, 220);
    ASSERT_TRUE(input.has_value());
    EXPECT_EQ(input->age(), 20);
    EXPECT_EQ(input->bmi_times_ten(), 220);
}
