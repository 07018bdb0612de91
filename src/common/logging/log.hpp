#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sg::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the async rotating-file logger configured by the --log_* flags.
void init();

void shutdown();

void info(std::string_view event, const std::unordered_map<std::string, std::string>& fields);

}  // namespace sg::log
