#include "birthday.hpp"

#include <chrono>
#include <regex>

#include <models/errors.hpp>

namespace contact_book::models {

namespace {

const std::regex kBirthdayRe(R"(^(\d{1,2})\.(\d{1,2})\.(\d{4})$)");

}  // namespace

bool IsValidDate(const BirthdayYear y, const BirthdayMonth m,
                 const BirthdayDay d) {
  const std::chrono::year_month_day date{
      std::chrono::year{y.GetUnderlying()},
      std::chrono::month{static_cast<unsigned int>(m.GetUnderlying())},
      std::chrono::day{static_cast<unsigned int>(d.GetUnderlying())}};
  return date.ok();
}

Birthday::Birthday(std::string raw) : raw_(std::move(raw)) {
  std::smatch match;
  if (!std::regex_match(raw_, match, kBirthdayRe)) {
    throw ValidationError(kFormatError);
  }

  d_ = BirthdayDay{std::stoi(match[1])};
  m_ = BirthdayMonth{std::stoi(match[2])};
  y_ = BirthdayYear{std::stoi(match[3])};
  // there is no year 0 in the proleptic Gregorian calendar
  if (y_.GetUnderlying() < 1 || !IsValidDate(y_, m_, d_)) {
    throw ValidationError(kFormatError);
  }
}

cctz::civil_day Birthday::GetDate() const {
  return cctz::civil_day(y_.GetUnderlying(), m_.GetUnderlying(),
                         d_.GetUnderlying());
}

}  // namespace contact_book::models
