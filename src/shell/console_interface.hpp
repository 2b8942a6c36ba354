#pragma once

#include <iosfwd>

#include <shell/user_interface.hpp>

namespace contact_book::shell {

class ConsoleInterface final : public UserInterface {
 public:
  ConsoleInterface(std::istream& in, std::ostream& out);

  void DisplayMessage(const std::string& message) override;
  std::optional<std::string> GetInput(const std::string& prompt) override;
  void DisplayContact(const models::Record& record) override;
  void DisplayAllContacts(const std::vector<models::Record>& records) override;

 private:
  std::istream& in_;
  std::ostream& out_;
};

}  // namespace contact_book::shell
