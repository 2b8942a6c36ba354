#pragma once

#include <functional>
#include <string>
#include <unordered_map>

#include <cctz/time_zone.h>

#include <commands/handlers.hpp>
#include <db/storage.hpp>
#include <models/address_book.hpp>
#include <shell/user_interface.hpp>

namespace contact_book::shell {

struct ShellSettings {
  cctz::time_zone timezone;
  int upcoming_window_days{models::AddressBook::kDefaultUpcomingWindowDays};
};

// Read-eval-print loop over an address book. The book is saved to `storage`
// when the user leaves.
class Shell final {
 public:
  static constexpr const auto kWelcome = "Welcome to the assistant bot!";
  static constexpr const auto kPrompt = "Enter a command: ";
  static constexpr const auto kHello = "How can I help you?";
  static constexpr const auto kGoodBye = "Good bye!";
  static constexpr const auto kInvalidCommand = "Invalid command.";

  // returns false to leave the loop
  using Handler = std::function<bool(const commands::Args&)>;

  Shell(models::AddressBook& book, const db::Storage& storage,
        UserInterface& ui, ShellSettings settings);

  void Run();

  // returns false once the user asked to leave
  bool Execute(const std::string& line);

 private:
  models::AddressBook& book_;
  const db::Storage& storage_;
  UserInterface& ui_;
  ShellSettings settings_;
  std::unordered_map<std::string, Handler> handlers_;

 private:
  void RegisterCommand(const std::string& command, Handler handler);
  void RegisterCommands();
  bool Display(const commands::CommandResult& result);
  bool ShowAll();
  bool Close();
};

}  // namespace contact_book::shell
