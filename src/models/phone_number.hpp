#pragma once

#include <string>

namespace contact_book::models {

// Ten decimal digits, nothing else.
class PhoneNumber final {
 public:
  static constexpr std::size_t kLength = 10;
  static constexpr const auto kFormatError = "Invalid phone format";

  // throws ValidationError
  explicit PhoneNumber(std::string raw);

  // Value is left untouched if `raw` is rejected.
  // throws ValidationError
  void Update(std::string raw);

  const std::string& GetValue() const { return value_; }

 private:
  std::string value_;
};

bool IsValidPhoneNumber(const std::string& raw);

}  // namespace contact_book::models
