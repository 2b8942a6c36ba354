#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <cctz/civil_time.h>
#include <cctz/time_zone.h>

#include <models/record.hpp>

namespace contact_book::models {

struct UpcomingBirthday {
  std::string name;
  // YYYY.MM.DD
  std::string congratulation_date;

  bool operator==(const UpcomingBirthday&) const = default;
};

// Records keyed by name, iterated in insertion order.
class AddressBook final {
 public:
  static constexpr int kDefaultUpcomingWindowDays = 7;

  // Overwrites a record with the same name in place.
  void AddRecord(Record record);

  // returns nullptr if there is no such contact
  Record* Find(const std::string& name);
  const Record* Find(const std::string& name) const;

  void Delete(const std::string& name);

  const std::vector<Record>& GetRecords() const { return records_; }
  std::size_t Size() const { return records_.size(); }
  bool IsEmpty() const { return records_.empty(); }

  // "Today" is the current civil day in `timezone`.
  std::vector<UpcomingBirthday> GetUpcomingBirthdays(
      const cctz::time_zone& timezone,
      int window_days = kDefaultUpcomingWindowDays) const;

 private:
  std::vector<Record> records_;
  std::unordered_map<std::string, std::size_t> index_;
};

namespace impl {

// Birthday month and day in `year`. February 29 falls on March 1 in
// non-leap years.
cctz::civil_day GetOccurrence(const Birthday& birthday, cctz::year_t year);

std::vector<UpcomingBirthday> FindUpcomingBirthdays(
    const std::vector<Record>& records, const cctz::civil_day& local_day,
    int window_days);

}  // namespace impl

}  // namespace contact_book::models
