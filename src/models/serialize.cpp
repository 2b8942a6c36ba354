#include "serialize.hpp"

#include <optional>
#include <string>
#include <vector>

#include <userver/formats/json/value.hpp>
#include <userver/formats/json/value_builder.hpp>
#include <userver/formats/parse/common_containers.hpp>

namespace contact_book::models {

userver::formats::json::Value Serialize(
    const Record& record,
    userver::formats::serialize::To<userver::formats::json::Value>) {
  userver::formats::json::ValueBuilder builder;
  builder["name"] = record.GetName().GetUnderlying();

  userver::formats::json::ValueBuilder phones(
      userver::formats::json::Type::kArray);
  for (const auto& phone : record.GetPhones()) {
    phones.PushBack(phone.GetValue());
  }
  builder["phones"] = std::move(phones);

  if (record.GetBirthday().has_value()) {
    builder["birthday"] = record.GetBirthday()->GetRaw();
  }
  return builder.ExtractValue();
}

Record Parse(const userver::formats::json::Value& json,
             userver::formats::parse::To<Record>) {
  Record record{ContactName{json["name"].As<std::string>()}};
  for (auto& phone : json["phones"].As<std::vector<std::string>>(
           std::vector<std::string>{})) {
    record.AddPhone(std::move(phone));
  }
  auto birthday = json["birthday"].As<std::optional<std::string>>();
  if (birthday.has_value()) {
    record.SetBirthday(std::move(*birthday));
  }
  return record;
}

userver::formats::json::Value Serialize(
    const AddressBook& book,
    userver::formats::serialize::To<userver::formats::json::Value>) {
  userver::formats::json::ValueBuilder records(
      userver::formats::json::Type::kArray);
  for (const auto& record : book.GetRecords()) {
    records.PushBack(record);
  }

  userver::formats::json::ValueBuilder builder;
  builder["records"] = std::move(records);
  return builder.ExtractValue();
}

AddressBook Parse(const userver::formats::json::Value& json,
                  userver::formats::parse::To<AddressBook>) {
  AddressBook book;
  for (const auto& item : json["records"]) {
    book.AddRecord(item.As<Record>());
  }
  return book;
}

}  // namespace contact_book::models
