#include "address_book.hpp"

#include <stdexcept>

#include <userver/utest/utest.hpp>
#include <userver/utils/datetime.hpp>
#include <userver/utils/datetime/from_string_saturating.hpp>
#include <userver/utils/mock_now.hpp>

using contact_book::models::AddressBook;
using contact_book::models::ContactName;
using contact_book::models::Record;
using contact_book::models::UpcomingBirthday;
using contact_book::models::impl::FindUpcomingBirthdays;

namespace {

Record MakeRecord(const std::string& name,
                  const std::optional<std::string>& birthday = std::nullopt) {
  Record record{ContactName{name}};
  if (birthday.has_value()) {
    record.SetBirthday(*birthday);
  }
  return record;
}

std::vector<std::string> NamesOf(const AddressBook& book) {
  std::vector<std::string> result;
  for (const auto& record : book.GetRecords()) {
    result.push_back(record.GetName().GetUnderlying());
  }
  return result;
}

}  // namespace

UTEST(AddressBook, AddAndFind) {
  AddressBook book;
  EXPECT_TRUE(book.IsEmpty());
  EXPECT_EQ(book.Find("Alice"), nullptr);

  book.AddRecord(MakeRecord("Alice"));
  const auto* record = book.Find("Alice");
  ASSERT_NE(record, nullptr);
  EXPECT_EQ(record->GetName().GetUnderlying(), "Alice");
  EXPECT_EQ(book.Find("alice"), nullptr);
}

UTEST(AddressBook, ReAddReplacesInPlace) {
  AddressBook book;
  book.AddRecord(MakeRecord("Alice"));
  book.AddRecord(MakeRecord("Bob"));

  auto replacement = MakeRecord("Alice");
  replacement.AddPhone("1234567890");
  book.AddRecord(std::move(replacement));

  EXPECT_EQ(book.Size(), 2);
  EXPECT_EQ(NamesOf(book), (std::vector<std::string>{"Alice", "Bob"}));
  ASSERT_NE(book.Find("Alice"), nullptr);
  EXPECT_EQ(book.Find("Alice")->GetPhones().size(), 1);
}

UTEST(AddressBook, Delete) {
  AddressBook book;
  book.AddRecord(MakeRecord("Alice"));
  book.AddRecord(MakeRecord("Bob"));
  book.AddRecord(MakeRecord("Carol"));

  book.Delete("Nobody");
  EXPECT_EQ(book.Size(), 3);

  book.Delete("Alice");
  EXPECT_EQ(NamesOf(book), (std::vector<std::string>{"Bob", "Carol"}));
  EXPECT_EQ(book.Find("Alice"), nullptr);
  ASSERT_NE(book.Find("Carol"), nullptr);
  EXPECT_EQ(book.Find("Carol")->GetName().GetUnderlying(), "Carol");

  book.AddRecord(MakeRecord("Alice"));
  EXPECT_EQ(NamesOf(book), (std::vector<std::string>{"Bob", "Carol", "Alice"}));
}

UTEST(FindUpcomingBirthdays, WindowBounds) {
  const cctz::civil_day local_day(2023, 2, 16);
  const std::vector<Record> records{
      MakeRecord("today", "16.02.1990"),
      MakeRecord("in_seven_days", "23.02.1985"),
      MakeRecord("in_eight_days", "24.02.1985"),
      MakeRecord("yesterday", "15.02.2000"),
      MakeRecord("no_birthday"),
      MakeRecord("tomorrow", "17.02.2001"),
  };

  EXPECT_EQ(FindUpcomingBirthdays(records, local_day, 7),
            (std::vector<UpcomingBirthday>{
                {"today", "2023.02.16"},
                {"in_seven_days", "2023.02.23"},
                {"tomorrow", "2023.02.17"},
            }));

  EXPECT_EQ(FindUpcomingBirthdays(records, local_day, 0),
            (std::vector<UpcomingBirthday>{{"today", "2023.02.16"}}));
}

UTEST(FindUpcomingBirthdays, YearBorder) {
  const cctz::civil_day local_day(2023, 12, 28);
  const std::vector<Record> records{
      MakeRecord("person1", "02.01.1990"),
      MakeRecord("person2", "31.12.1990"),
      MakeRecord("person3", "05.01.1990"),
      MakeRecord("person4", "27.12.1990"),
  };

  EXPECT_EQ(FindUpcomingBirthdays(records, local_day, 7),
            (std::vector<UpcomingBirthday>{
                {"person1", "2024.01.02"},
                {"person2", "2023.12.31"},
            }));
}

UTEST(FindUpcomingBirthdays, LeapDayInNonLeapYear) {
  const std::vector<Record> records{MakeRecord("Bob", "29.02.2020")};

  EXPECT_EQ(FindUpcomingBirthdays(records, cctz::civil_day(2023, 2, 25), 7),
            (std::vector<UpcomingBirthday>{{"Bob", "2023.03.01"}}));
  EXPECT_EQ(FindUpcomingBirthdays(records, cctz::civil_day(2023, 3, 1), 0),
            (std::vector<UpcomingBirthday>{{"Bob", "2023.03.01"}}));
  EXPECT_TRUE(
      FindUpcomingBirthdays(records, cctz::civil_day(2023, 3, 2), 7).empty());
  EXPECT_EQ(FindUpcomingBirthdays(records, cctz::civil_day(2024, 2, 25), 7),
            (std::vector<UpcomingBirthday>{{"Bob", "2024.02.29"}}));
}

UTEST(FindUpcomingBirthdays, NegativeWindow) {
  EXPECT_THROW(FindUpcomingBirthdays({}, cctz::civil_day(2023, 1, 1), -1),
               std::invalid_argument);
}

UTEST(AddressBook, GetUpcomingBirthdays) {
  userver::utils::datetime::MockNowSet(
      userver::utils::datetime::Stringtime("2023-02-16T20:30:00+0000"));

  AddressBook book;
  book.AddRecord(MakeRecord("person1", "23.02.1990"));
  book.AddRecord(MakeRecord("person2", "24.02.1990"));
  book.AddRecord(MakeRecord("person3", "16.02.1990"));

  EXPECT_EQ(book.GetUpcomingBirthdays(cctz::utc_time_zone()),
            (std::vector<UpcomingBirthday>{
                {"person1", "2023.02.23"},
                {"person3", "2023.02.16"},
            }));
  EXPECT_EQ(book.GetUpcomingBirthdays(cctz::utc_time_zone(), 8).size(), 3);

  userver::utils::datetime::MockNowUnset();
}

UTEST(AddressBook, GetUpcomingBirthdaysTimezoneApplication) {
  userver::utils::datetime::MockNowSet(
      userver::utils::datetime::Stringtime("2023-01-01T20:30:00+0000"));

  cctz::time_zone vladivostok_timezone;
  ASSERT_TRUE(cctz::load_time_zone("Asia/Vladivostok", &vladivostok_timezone));

  AddressBook book;
  book.AddRecord(MakeRecord("person1", "01.01.1990"));
  book.AddRecord(MakeRecord("person2", "02.01.1990"));

  EXPECT_EQ(book.GetUpcomingBirthdays(vladivostok_timezone, 0),
            (std::vector<UpcomingBirthday>{{"person2", "2023.01.02"}}));
  EXPECT_EQ(book.GetUpcomingBirthdays(cctz::utc_time_zone(), 0),
            (std::vector<UpcomingBirthday>{{"person1", "2023.01.01"}}));

  userver::utils::datetime::MockNowUnset();
}
