#include "shell.hpp"

#include <exception>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include <shell/parse_input.hpp>

namespace contact_book::shell {

Shell::Shell(models::AddressBook& book, const db::Storage& storage,
             UserInterface& ui, ShellSettings settings)
    : book_(book), storage_(storage), ui_(ui), settings_(std::move(settings)) {
  RegisterCommands();
}

void Shell::RegisterCommand(const std::string& command, Handler handler) {
  handlers_.insert_or_assign(command, std::move(handler));
}

void Shell::RegisterCommands() {
  RegisterCommand("hello", [this](const commands::Args&) {
    ui_.DisplayMessage(kHello);
    return true;
  });
  RegisterCommand("add", [this](const commands::Args& args) {
    return Display(commands::AddContact(args, book_));
  });
  RegisterCommand("change", [this](const commands::Args& args) {
    return Display(commands::ChangeContact(args, book_));
  });
  RegisterCommand("phone", [this](const commands::Args& args) {
    return Display(commands::ShowPhone(args, book_));
  });
  RegisterCommand("all", [this](const commands::Args&) { return ShowAll(); });
  RegisterCommand("add-birthday", [this](const commands::Args& args) {
    return Display(commands::AddBirthday(args, book_));
  });
  RegisterCommand("show-birthday", [this](const commands::Args& args) {
    return Display(commands::ShowBirthday(args, book_));
  });
  RegisterCommand("birthdays", [this](const commands::Args&) {
    return Display(commands::ShowUpcomingBirthdays(
        book_, settings_.timezone, settings_.upcoming_window_days));
  });
  RegisterCommand("close", [this](const commands::Args&) { return Close(); });
  RegisterCommand("exit", [this](const commands::Args&) { return Close(); });
}

void Shell::Run() {
  ui_.DisplayMessage(kWelcome);
  while (true) {
    const auto line = ui_.GetInput(kPrompt);
    if (!line.has_value()) {
      LOG_INFO() << "End of input, leaving";
      Close();
      return;
    }
    if (!Execute(*line)) {
      return;
    }
  }
}

bool Shell::Execute(const std::string& line) {
  const auto input = ParseInput(line);
  if (input.command.empty()) {
    return true;
  }
  LOG_DEBUG() << "Got command " << input.command;

  const auto it = handlers_.find(input.command);
  if (it == handlers_.end()) {
    LOG_INFO() << "Unknown command " << input.command;
    ui_.DisplayMessage(kInvalidCommand);
    return true;
  }
  return it->second(input.args);
}

bool Shell::Display(const commands::CommandResult& result) {
  if (result.status != commands::CommandStatus::kSuccess) {
    LOG_DEBUG() << "Command failed: " << result.message;
  }
  ui_.DisplayMessage(result.message);
  return true;
}

bool Shell::ShowAll() {
  if (book_.IsEmpty()) {
    ui_.DisplayMessage(commands::kNoContacts);
    return true;
  }
  ui_.DisplayAllContacts(book_.GetRecords());
  return true;
}

bool Shell::Close() {
  try {
    storage_.Save(book_);
  } catch (const std::exception& exc) {
    LOG_ERROR() << "Failed to save address book: " << exc;
    ui_.DisplayMessage(fmt::format("Failed to save contacts: {}", exc.what()));
    return false;
  }
  ui_.DisplayMessage(kGoodBye);
  return false;
}

}  // namespace contact_book::shell
