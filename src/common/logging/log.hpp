#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/error.hpp"

namespace iid::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

void init();

void shutdown();

using Fields = std::unordered_map<std::string, std::string>;

/// "event key=value ..." with keys in sorted order.
auto format_event(std::string_view event, const Fields& fields) -> std::string;

/// format_event with the error's kind and message appended as fields.
auto format_failure(std::string_view event, const core::CoreError& error, Fields fields)
    -> std::string;

void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

void failure(std::string_view event, const core::CoreError& error, Fields fields = {});

}  // namespace iid::log
