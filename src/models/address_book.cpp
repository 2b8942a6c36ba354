#include "address_book.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/utils/datetime.hpp>

namespace contact_book::models {

void AddressBook::AddRecord(Record record) {
  const auto& name = record.GetName().GetUnderlying();
  const auto it = index_.find(name);
  if (it != index_.end()) {
    records_[it->second] = std::move(record);
    return;
  }
  index_.emplace(name, records_.size());
  records_.push_back(std::move(record));
}

Record* AddressBook::Find(const std::string& name) {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

const Record* AddressBook::Find(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

void AddressBook::Delete(const std::string& name) {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return;
  }
  const auto position = it->second;
  index_.erase(it);
  records_.erase(records_.begin() + position);
  for (auto& [key, record_position] : index_) {
    if (record_position > position) {
      --record_position;
    }
  }
}

std::vector<UpcomingBirthday> AddressBook::GetUpcomingBirthdays(
    const cctz::time_zone& timezone, const int window_days) const {
  const auto now = userver::utils::datetime::Now();
  LOG_DEBUG() << "at " << userver::utils::datetime::Timestring(now);
  const auto local_day = cctz::civil_day(cctz::convert(now, timezone));
  return impl::FindUpcomingBirthdays(records_, local_day, window_days);
}

namespace impl {

cctz::civil_day GetOccurrence(const Birthday& birthday,
                              const cctz::year_t year) {
  // civil_day normalizes out-of-range fields, 29.02 becomes 01.03
  return cctz::civil_day(year, birthday.GetMonth().GetUnderlying(),
                         birthday.GetDay().GetUnderlying());
}

std::vector<UpcomingBirthday> FindUpcomingBirthdays(
    const std::vector<Record>& records, const cctz::civil_day& local_day,
    const int window_days) {
  if (window_days < 0) {
    throw std::invalid_argument(
        fmt::format("Negative upcoming window: {} days", window_days));
  }

  std::vector<UpcomingBirthday> result;
  for (const auto& record : records) {
    const auto& birthday = record.GetBirthday();
    if (!birthday.has_value()) {
      LOG_DEBUG() << "Skip contact without birthday";
      continue;
    }

    auto occurrence = GetOccurrence(*birthday, local_day.year());
    if (occurrence < local_day) {
      occurrence = GetOccurrence(*birthday, local_day.year() + 1);
    }

    const auto days_left = occurrence - local_day;
    if (days_left < 0 || days_left > window_days) {
      continue;
    }

    result.push_back(UpcomingBirthday{
        record.GetName().GetUnderlying(),
        fmt::format("{:04}.{:02}.{:02}", occurrence.year(), occurrence.month(),
                    occurrence.day())});
  }
  return result;
}

}  // namespace impl

}  // namespace contact_book::models
