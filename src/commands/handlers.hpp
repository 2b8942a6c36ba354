#pragma once

#include <string>
#include <vector>

#include <cctz/time_zone.h>

#include <models/address_book.hpp>

namespace contact_book::commands {

using Args = std::vector<std::string>;

enum class CommandStatus {
  kSuccess,
  kValidationFailure,
  kNotFound,
  kArgumentCountFailure,
};

struct CommandResult {
  CommandStatus status{CommandStatus::kSuccess};
  std::string message;
};

inline constexpr auto kContactAdded = "Contact added.";
inline constexpr auto kContactUpdated = "Contact updated.";
inline constexpr auto kBirthdayAdded = "Birthday added.";
inline constexpr auto kNameNotFound =
    "Name not found. Please, check and try again.";
inline constexpr auto kBirthdayNotSet = "Birthday is not set.";
inline constexpr auto kEnterCorrectInformation = "Enter correct information.";
inline constexpr auto kNoContacts = "No contacts saved.";
inline constexpr auto kNoUpcomingBirthdays = "There are no upcoming birthdays.";

// add <name> <phone>
CommandResult AddContact(const Args& args, models::AddressBook& book);

// change <name> <old phone> <new phone>
CommandResult ChangeContact(const Args& args, models::AddressBook& book);

// phone <name>
CommandResult ShowPhone(const Args& args, const models::AddressBook& book);

// add-birthday <name> <DD.MM.YYYY>
CommandResult AddBirthday(const Args& args, models::AddressBook& book);

// show-birthday <name>
CommandResult ShowBirthday(const Args& args, const models::AddressBook& book);

// birthdays
CommandResult ShowUpcomingBirthdays(const models::AddressBook& book,
                                    const cctz::time_zone& timezone,
                                    int window_days);

}  // namespace contact_book::commands
