#pragma once

/**
 * Input Validator
 *
 * Parses one line of client text into a range-checked integer. The age
 * bound is [10, 25]; the BMI bound is BMI * 10, i.e. [185, 249] for a BMI
 * of 18.5 - 24.9.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace zk_insurance {

enum class FieldKind {
    Age,
    BmiTimesTen,
};

// Inclusive bounds
constexpr int64_t MIN_AGE = 10;
constexpr int64_t MAX_AGE = 25;
constexpr int64_t MIN_BMI_TIMES_TEN = 185;
constexpr int64_t MAX_BMI_TIMES_TEN = 249;

int64_t field_min(FieldKind kind);
int64_t field_max(FieldKind kind);

enum class ValidationErrorKind {
    NotANumber,
    OutOfRange,
};

struct ValidationError {
    ValidationErrorKind kind;
    FieldKind field;
    int64_t min;
    int64_t max;

    // Text shown to the client before the re-prompt
    std::string message() const;
};

class ValidationResult {
public:
    static ValidationResult accepted(int value) {
        ValidationResult r;
        r.value_ = value;
        return r;
    }

    static ValidationResult rejected(ValidationErrorKind kind, FieldKind field) {
        ValidationResult r;
        r.error_ = ValidationError{kind, field, field_min(field), field_max(field)};
        return r;
    }

    bool ok() const { return value_.has_value(); }
    int value() const { return *value_; }
    const ValidationError& error() const { return *error_; }

private:
    ValidationResult() = default;

    std::optional<int> value_;
    std::optional<ValidationError> error_;
};

/**
 * Validate a raw client line for the given field.
 *
 * Leading/trailing whitespace is ignored. The rest must be a base-10 integer
 * with an optional leading '-' and nothing else.
 */
ValidationResult validate(std::string_view raw_line, FieldKind kind);

/**
 * A pair of inputs that has passed validation.
 *
 * Only create() builds one, and it refuses out-of-range values, so every
 * instance satisfies both bounds.
 */
class VerificationInput {
public:
    static std::optional<VerificationInput> create(int age, int bmi_times_ten);

    int age() const { return age_; }
    int bmi_times_ten() const { return bmi_times_ten_; }

private:
    VerificationInput(int age, int bmi_times_ten)
        : age_(age), bmi_times_ten_(bmi_times_ten) {}

    int age_;
    int bmi_times_ten_;
};

} // namespace zk_insurance
