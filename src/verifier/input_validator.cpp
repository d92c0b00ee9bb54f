#include "verifier/input_validator.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace zk_insurance {

namespace {

std::string_view trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

} // namespace

int64_t field_min(FieldKind kind) {
    return kind == FieldKind::Age ? MIN_AGE : MIN_BMI_TIMES_TEN;
}

int64_t field_max(FieldKind kind) {
    return kind == FieldKind::Age ? MAX_AGE : MAX_BMI_TIMES_TEN;
}

std::string ValidationError::message() const {
    if (kind == ValidationErrorKind::NotANumber) {
        return "Invalid input: please enter a whole number.";
    }
    if (field == FieldKind::Age) {
        return "Age must be between " + std::to_string(min) + " and " + std::to_string(max) + ".";
    }
    return "BMI multiplied by 10 must be between " + std::to_string(min) + " and " +
           std::to_string(max) + ".";
}

ValidationResult validate(std::string_view raw_line, FieldKind kind) {
    std::string_view text = trim(raw_line);
    if (text.empty()) {
        return ValidationResult::rejected(ValidationErrorKind::NotANumber, kind);
    }

    // from_chars accepts a leading '-' but not '+', which is what we want
    int64_t parsed = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed, 10);

    if (ec == std::errc::result_out_of_range) {
        // All digits, just too many of them
        return ValidationResult::rejected(ValidationErrorKind::OutOfRange, kind);
    }
    if (ec != std::errc() || ptr != last) {
        return ValidationResult::rejected(ValidationErrorKind::NotANumber, kind);
    }

    if (parsed < field_min(kind) || parsed > field_max(kind)) {
        return ValidationResult::rejected(ValidationErrorKind::OutOfRange, kind);
    }
    return ValidationResult::accepted(static_cast<int>(parsed));
}

std::optional<VerificationInput> VerificationInput::create(int age, int bmi_times_ten) {
    if (age < MIN_AGE || age > MAX_AGE) {
        return std::nullopt;
    }
    if (bmi_times_ten < MIN_BMI_TIMES_TEN || bmi_times_ten > MAX_BMI_TIMES_TEN) {
        return std::nullopt;
    }
    return VerificationInput(age, bmi_times_ten);
}

} // namespace zk_insurance
