#include "record.hpp"

#include <algorithm>

#include <fmt/format.h>

#include <models/errors.hpp>

namespace contact_book::models {

Record::Record(ContactName name) : name_(std::move(name)) {
  if (name_.GetUnderlying().empty()) {
    throw ValidationError(kEmptyName);
  }
}

void Record::AddPhone(std::string raw) {
  phones_.emplace_back(std::move(raw));
}

void Record::RemovePhone(const std::string& raw) {
  phones_.erase(std::remove_if(phones_.begin(), phones_.end(),
                               [&raw](const PhoneNumber& phone) {
                                 return phone.GetValue() == raw;
                               }),
                phones_.end());
}

void Record::EditPhone(const std::string& old_raw, std::string new_raw) {
  const auto it = std::find_if(phones_.begin(), phones_.end(),
                               [&old_raw](const PhoneNumber& phone) {
                                 return phone.GetValue() == old_raw;
                               });
  if (it == phones_.end()) {
    throw NotFoundError(kPhoneNotFound);
  }
  it->Update(std::move(new_raw));
}

void Record::SetBirthday(std::string raw) {
  birthday_.emplace(Birthday{std::move(raw)});
}

std::string Record::ToString() const {
  std::vector<std::string> phones;
  phones.reserve(phones_.size());
  for (const auto& phone : phones_) {
    phones.push_back(phone.GetValue());
  }
  return fmt::format("Contact name: {}, phones: {}", name_.GetUnderlying(),
                     fmt::join(phones, "; "));
}

}  // namespace contact_book::models
