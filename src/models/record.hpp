#pragma once

#include <optional>
#include <string>
#include <vector>

#include <userver/utils/strong_typedef.hpp>

#include <models/birthday.hpp>
#include <models/phone_number.hpp>

namespace contact_book::models {

using ContactName =
    userver::utils::StrongTypedef<class ContactNameTag, std::string>;

class Record final {
 public:
  static constexpr const auto kPhoneNotFound = "Phone number not found";
  static constexpr const auto kEmptyName = "Contact name must not be empty";

  // throws ValidationError on an empty name
  explicit Record(ContactName name);

  const ContactName& GetName() const { return name_; }
  const std::vector<PhoneNumber>& GetPhones() const { return phones_; }
  const std::optional<Birthday>& GetBirthday() const { return birthday_; }

  // throws ValidationError
  void AddPhone(std::string raw);
  void RemovePhone(const std::string& raw);
  // Replaces the first phone equal to `old_raw`.
  // throws ValidationError, NotFoundError
  void EditPhone(const std::string& old_raw, std::string new_raw);
  // throws ValidationError
  void SetBirthday(std::string raw);

  std::string ToString() const;

 private:
  ContactName name_;
  std::vector<PhoneNumber> phones_;
  std::optional<Birthday> birthday_;
};

}  // namespace contact_book::models
