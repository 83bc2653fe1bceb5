#ifndef UTILS_LOGGER_HPP
#define UTILS_LOGGER_HPP

#include <memory>
#include <string>
#include "core/logging.hpp"

// Messages below threshold are dropped
std::unique_ptr<ILogger> CreateLogger(std::string tag, LogPriority threshold = LogPriority::INFO);

#endif // UTILS_LOGGER_HPP
