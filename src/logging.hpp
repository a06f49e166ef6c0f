#ifndef LOGGING_HPP
#define LOGGING_HPP
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

constexpr const char *kLoggerName = "MAB Application";

// Creates the coloured console logger on first use and sets its level.
// Unknown level names fall back to info.
std::shared_ptr<spdlog::logger> setup_logging(const std::string &level = "info");
std::shared_ptr<spdlog::logger> get_logger();
#endif
