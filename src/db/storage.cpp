#include "storage.hpp"

#include <boost/filesystem/operations.hpp>

#include <userver/formats/json/serialize.hpp>
#include <userver/formats/json/value.hpp>
#include <userver/formats/json/value_builder.hpp>
#include <userver/fs/blocking/read.hpp>
#include <userver/fs/blocking/write.hpp>
#include <userver/logging/log.hpp>

#include <models/serialize.hpp>

namespace contact_book::db {

namespace {

const auto kFilePerms = boost::filesystem::perms::owner_read |
                        boost::filesystem::perms::owner_write;

}  // namespace

JsonFileStorage::JsonFileStorage(std::string path) : path_(std::move(path)) {}

models::AddressBook JsonFileStorage::Load() const {
  if (!userver::fs::blocking::FileExists(path_)) {
    LOG_INFO() << "No saved address book at " << path_ << ", starting empty";
    return {};
  }

  const auto contents = userver::fs::blocking::ReadFileContents(path_);
  auto book = userver::formats::json::FromString(contents)
                  .As<models::AddressBook>();
  LOG_INFO() << "Loaded " << book.Size() << " contacts from " << path_;
  return book;
}

void JsonFileStorage::Save(const models::AddressBook& book) const {
  const auto json = userver::formats::json::ValueBuilder{book}.ExtractValue();
  // a crash mid-write leaves the previous file intact
  userver::fs::blocking::RewriteFileContentsAtomically(
      path_, userver::formats::json::ToString(json), kFilePerms);
  LOG_INFO() << "Saved " << book.Size() << " contacts to " << path_;
}

}  // namespace contact_book::db
