#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include <userver/logging/log.hpp>
#include <userver/logging/logger.hpp>

#include <config.hpp>
#include <db/storage.hpp>
#include <shell/console_interface.hpp>
#include <shell/shell.hpp>

namespace {

namespace po = boost::program_options;

userver::logging::LoggerPtr MakeLogger(
    const contact_book::LoggingConfig& config) {
  if (config.file.has_value()) {
    return userver::logging::MakeFileLogger("default", *config.file,
                                            userver::logging::Format::kTskv,
                                            config.level);
  }
  return userver::logging::MakeStderrLogger(
      "default", userver::logging::Format::kTskv, config.level);
}

}  // namespace

int main(int argc, char* argv[]) {
  po::options_description desc("Allowed options");
  desc.add_options()("help,h", "produce help message")(
      "config,c", po::value<std::string>(), "path to the YAML config");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error& exc) {
    std::cerr << exc.what() << '\n' << desc << '\n';
    return 1;
  }

  if (vm.count("help")) {
    std::cout << desc << '\n';
    return 0;
  }

  std::optional<std::string> config_path;
  if (vm.count("config")) {
    config_path = vm["config"].as<std::string>();
  }

  contact_book::Config config;
  try {
    config = contact_book::LoadConfig(config_path);
  } catch (const std::exception& exc) {
    std::cerr << "Failed to load config: " << exc.what() << '\n';
    return 1;
  }

  userver::logging::DefaultLoggerGuard logger_guard{MakeLogger(config.logging)};

  try {
    const auto timezone = contact_book::LoadTimezone(config.timezone);
    const contact_book::db::JsonFileStorage storage{config.storage_path};
    auto book = storage.Load();

    contact_book::shell::ConsoleInterface ui{std::cin, std::cout};
    contact_book::shell::Shell shell{
        book, storage, ui,
        contact_book::shell::ShellSettings{timezone,
                                           config.upcoming_window_days}};
    shell.Run();
  } catch (const std::exception& exc) {
    LOG_ERROR() << "Unexpected exception " << exc;
    std::cerr << exc.what() << '\n';
    return 1;
  }

  return 0;
}
