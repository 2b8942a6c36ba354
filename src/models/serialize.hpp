#pragma once

#include <userver/formats/json_fwd.hpp>
#include <userver/formats/parse/to.hpp>
#include <userver/formats/serialize/to.hpp>

#include <models/address_book.hpp>
#include <models/record.hpp>

namespace contact_book::models {

userver::formats::json::Value Serialize(
    const Record& record,
    userver::formats::serialize::To<userver::formats::json::Value>);

// Runs the same validation as the constructors do.
// throws ValidationError
Record Parse(const userver::formats::json::Value& json,
             userver::formats::parse::To<Record>);

userver::formats::json::Value Serialize(
    const AddressBook& book,
    userver::formats::serialize::To<userver::formats::json::Value>);

AddressBook Parse(const userver::formats::json::Value& json,
                  userver::formats::parse::To<AddressBook>);

}  // namespace contact_book::models
