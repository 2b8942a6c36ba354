#pragma once

#include <string>

#include <cctz/civil_time.h>

#include <userver/utils/strong_typedef.hpp>

namespace contact_book::models {

using BirthdayDay = userver::utils::StrongTypedef<class BirthdayDayTag, int>;
using BirthdayMonth =
    userver::utils::StrongTypedef<class BirthdayMonthTag, int>;
using BirthdayYear = userver::utils::StrongTypedef<class BirthdayYearTag, int>;

bool IsValidDate(BirthdayYear y, BirthdayMonth m, BirthdayDay d);

// Date of birth written as DD.MM.YYYY. Keeps the text it was created from.
class Birthday final {
 public:
  static constexpr const auto kFormatError =
      "Invalid date format. Use DD.MM.YYYY";

  // throws ValidationError
  explicit Birthday(std::string raw);

  const std::string& GetRaw() const { return raw_; }
  BirthdayDay GetDay() const { return d_; }
  BirthdayMonth GetMonth() const { return m_; }
  BirthdayYear GetYear() const { return y_; }
  cctz::civil_day GetDate() const;

 private:
  std::string raw_;
  BirthdayDay d_{};
  BirthdayMonth m_{};
  BirthdayYear y_{};
};

}  // namespace contact_book::models
