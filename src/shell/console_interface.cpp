#include "console_interface.hpp"

#include <istream>
#include <ostream>

namespace contact_book::shell {

ConsoleInterface::ConsoleInterface(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

void ConsoleInterface::DisplayMessage(const std::string& message) {
  out_ << message << '\n';
}

std::optional<std::string> ConsoleInterface::GetInput(
    const std::string& prompt) {
  out_ << prompt << std::flush;
  std::string line;
  if (!std::getline(in_, line)) {
    return std::nullopt;
  }
  return line;
}

void ConsoleInterface::DisplayContact(const models::Record& record) {
  out_ << record.ToString() << '\n';
}

void ConsoleInterface::DisplayAllContacts(
    const std::vector<models::Record>& records) {
  for (const auto& record : records) {
    DisplayContact(record);
  }
}

}  // namespace contact_book::shell
