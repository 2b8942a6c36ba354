#include "parse_input.hpp"

#include <algorithm>
#include <iterator>

#include <userver/utils/text.hpp>

namespace contact_book::shell {

ParsedInput ParseInput(const std::string_view line) {
  auto tokens = userver::utils::text::Split(line, " \t\r\n");
  tokens.erase(std::remove(tokens.begin(), tokens.end(), std::string{}),
               tokens.end());
  if (tokens.empty()) {
    return {};
  }

  ParsedInput result;
  result.command = userver::utils::text::ToLower(tokens.front());
  result.args.assign(std::make_move_iterator(tokens.begin() + 1),
                     std::make_move_iterator(tokens.end()));
  return result;
}

}  // namespace contact_book::shell
