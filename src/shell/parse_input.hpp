#pragma once

#include <string>
#include <string_view>

#include <commands/handlers.hpp>

namespace contact_book::shell {

struct ParsedInput {
  // lower-cased, empty for a blank line
  std::string command;
  commands::Args args;
};

ParsedInput ParseInput(std::string_view line);

}  // namespace contact_book::shell
