#pragma once

#include <string>

#include <models/address_book.hpp>

namespace contact_book::db {

// Loads and saves the whole address book at once.
class Storage {
 public:
  virtual ~Storage() = default;

  // returns an empty book when nothing was saved yet
  virtual models::AddressBook Load() const = 0;
  // overwrites previously saved state
  virtual void Save(const models::AddressBook& book) const = 0;
};

class JsonFileStorage final : public Storage {
 public:
  explicit JsonFileStorage(std::string path);

  models::AddressBook Load() const override;
  void Save(const models::AddressBook& book) const override;

  const std::string& GetPath() const { return path_; }

 private:
  std::string path_;
};

}  // namespace contact_book::db
