#pragma once

#include <optional>
#include <string>

#include <cctz/time_zone.h>

#include <userver/formats/parse/to.hpp>
#include <userver/formats/yaml_fwd.hpp>
#include <userver/logging/level.hpp>

#include <models/address_book.hpp>

namespace contact_book {

struct LoggingConfig {
  userver::logging::Level level{userver::logging::Level::kWarning};
  // stderr when not set
  std::optional<std::string> file;
};

struct Config {
  static constexpr const auto kLocalTimezone = "local";

  std::string storage_path{"database.json"};
  std::string timezone{kLocalTimezone};
  int upcoming_window_days{models::AddressBook::kDefaultUpcomingWindowDays};
  LoggingConfig logging;
};

Config Parse(const userver::formats::yaml::Value& yaml,
             userver::formats::parse::To<Config>);

// Defaults when `path` is not set.
Config LoadConfig(const std::optional<std::string>& path);

// throws std::runtime_error for an unknown timezone
cctz::time_zone LoadTimezone(const std::string& name);

}  // namespace contact_book
