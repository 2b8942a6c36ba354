#include "handlers.hpp"

#include <utility>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include <models/errors.hpp>

namespace contact_book::commands {

namespace {

// Turns core failures into a result the shell can print.
template <typename Handler>
CommandResult HandleInputErrors(Handler&& handler) {
  try {
    return std::forward<Handler>(handler)();
  } catch (const models::ValidationError& exc) {
    LOG_INFO() << "Rejected input: " << exc.what();
    return {CommandStatus::kValidationFailure, exc.what()};
  } catch (const models::NotFoundError& exc) {
    LOG_INFO() << "Not found: " << exc.what();
    return {CommandStatus::kNotFound, exc.what()};
  } catch (const models::ArgumentCountError& exc) {
    LOG_INFO() << "Bad argument count: " << exc.what();
    return {CommandStatus::kArgumentCountFailure, kEnterCorrectInformation};
  }
}

void RequireArgs(const Args& args, const std::size_t count) {
  if (args.size() < count) {
    throw models::ArgumentCountError(
        fmt::format("expected {} arguments, got {}", count, args.size()));
  }
}

template <typename Book>
auto& FindOrThrow(Book& book, const std::string& name) {
  auto* record = book.Find(name);
  if (record == nullptr) {
    throw models::NotFoundError(kNameNotFound);
  }
  return *record;
}

}  // namespace

CommandResult AddContact(const Args& args, models::AddressBook& book) {
  return HandleInputErrors([&]() -> CommandResult {
    RequireArgs(args, 2);
    const auto& name = args[0];
    const auto& phone = args[1];

    if (auto* record = book.Find(name); record != nullptr) {
      record->AddPhone(phone);
      return {CommandStatus::kSuccess, kContactUpdated};
    }

    // record is built aside so a rejected phone does not leave it in the book
    models::Record record{models::ContactName{name}};
    record.AddPhone(phone);
    book.AddRecord(std::move(record));
    return {CommandStatus::kSuccess, kContactAdded};
  });
}

CommandResult ChangeContact(const Args& args, models::AddressBook& book) {
  return HandleInputErrors([&]() -> CommandResult {
    RequireArgs(args, 3);
    auto& record = FindOrThrow(book, args[0]);
    record.EditPhone(args[1], args[2]);
    return {CommandStatus::kSuccess, kContactUpdated};
  });
}

CommandResult ShowPhone(const Args& args, const models::AddressBook& book) {
  return HandleInputErrors([&]() -> CommandResult {
    RequireArgs(args, 1);
    const auto& record = FindOrThrow(book, args[0]);
    std::vector<std::string> phones;
    phones.reserve(record.GetPhones().size());
    for (const auto& phone : record.GetPhones()) {
      phones.push_back(phone.GetValue());
    }
    return {CommandStatus::kSuccess,
            fmt::format("{}", fmt::join(phones, "; "))};
  });
}

CommandResult AddBirthday(const Args& args, models::AddressBook& book) {
  return HandleInputErrors([&]() -> CommandResult {
    RequireArgs(args, 2);
    auto& record = FindOrThrow(book, args[0]);
    record.SetBirthday(args[1]);
    return {CommandStatus::kSuccess, kBirthdayAdded};
  });
}

CommandResult ShowBirthday(const Args& args, const models::AddressBook& book) {
  return HandleInputErrors([&]() -> CommandResult {
    RequireArgs(args, 1);
    const auto& record = FindOrThrow(book, args[0]);
    if (!record.GetBirthday().has_value()) {
      throw models::NotFoundError(kBirthdayNotSet);
    }
    return {CommandStatus::kSuccess, record.GetBirthday()->GetRaw()};
  });
}

CommandResult ShowUpcomingBirthdays(const models::AddressBook& book,
                                    const cctz::time_zone& timezone,
                                    const int window_days) {
  const auto birthdays = book.GetUpcomingBirthdays(timezone, window_days);
  if (birthdays.empty()) {
    return {CommandStatus::kSuccess, kNoUpcomingBirthdays};
  }

  std::vector<std::string> lines;
  lines.reserve(birthdays.size());
  for (const auto& birthday : birthdays) {
    lines.push_back(
        fmt::format("{}: {}", birthday.name, birthday.congratulation_date));
  }
  return {CommandStatus::kSuccess, fmt::format("{}", fmt::join(lines, "\n"))};
}

}  // namespace contact_book::commands
