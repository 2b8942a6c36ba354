#pragma once

#include <optional>
#include <string>
#include <vector>

#include <models/record.hpp>

namespace contact_book::shell {

class UserInterface {
 public:
  virtual ~UserInterface() = default;

  virtual void DisplayMessage(const std::string& message) = 0;
  // returns std::nullopt at the end of input
  virtual std::optional<std::string> GetInput(const std::string& prompt) = 0;
  virtual void DisplayContact(const models::Record& record) = 0;
  virtual void DisplayAllContacts(
      const std::vector<models::Record>& records) = 0;
};

}  // namespace contact_book::shell
