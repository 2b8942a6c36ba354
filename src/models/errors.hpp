#pragma once

#include <stdexcept>

namespace contact_book::models {

class ValidationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class NotFoundError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ArgumentCountError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace contact_book::models
