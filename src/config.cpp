#include "config.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <userver/formats/yaml/serialize.hpp>
#include <userver/formats/yaml/value.hpp>

namespace contact_book {

namespace {

LoggingConfig ParseLogging(const userver::formats::yaml::Value& yaml) {
  LoggingConfig result;
  if (yaml.IsMissing()) {
    return result;
  }
  const auto level = yaml["level"].As<std::optional<std::string>>();
  if (level.has_value()) {
    result.level = userver::logging::LevelFromString(*level);
  }
  result.file = yaml["file"].As<std::optional<std::string>>();
  return result;
}

}  // namespace

Config Parse(const userver::formats::yaml::Value& yaml,
             userver::formats::parse::To<Config>) {
  Config config;
  config.storage_path =
      yaml["storage_path"].As<std::string>(config.storage_path);
  config.timezone = yaml["timezone"].As<std::string>(config.timezone);
  config.upcoming_window_days =
      yaml["upcoming_window_days"].As<int>(config.upcoming_window_days);
  config.logging = ParseLogging(yaml["logging"]);

  if (config.storage_path.empty()) {
    throw std::runtime_error("storage_path must not be empty");
  }
  if (config.upcoming_window_days < 0) {
    throw std::runtime_error(
        fmt::format("upcoming_window_days must not be negative, got {}",
                    config.upcoming_window_days));
  }
  return config;
}

Config LoadConfig(const std::optional<std::string>& path) {
  if (!path.has_value()) {
    return {};
  }
  return userver::formats::yaml::blocking::FromFile(*path).As<Config>();
}

cctz::time_zone LoadTimezone(const std::string& name) {
  if (name == Config::kLocalTimezone) {
    return cctz::local_time_zone();
  }
  cctz::time_zone timezone;
  if (!cctz::load_time_zone(name, &timezone)) {
    throw std::runtime_error("Unknown timezone " + name);
  }
  return timezone;
}

}  // namespace contact_book
