#include "phone_number.hpp"

#include <algorithm>
#include <cctype>

#include <models/errors.hpp>

namespace contact_book::models {

bool IsValidPhoneNumber(const std::string& raw) {
  return raw.size() == PhoneNumber::kLength &&
         std::all_of(raw.begin(), raw.end(), [](const unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

PhoneNumber::PhoneNumber(std::string raw) { Update(std::move(raw)); }

void PhoneNumber::Update(std::string raw) {
  if (!IsValidPhoneNumber(raw)) {
    throw ValidationError(kFormatError);
  }
  value_ = std::move(raw);
}

}  // namespace contact_book::models
