#include "./log.hpp"

#include <magic_enum.hpp>
#include <neo/assert.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

spdlog::level::level_enum to_spdlog(pdg::log::level l) {
    using pdg::log::level;
    switch (l) {
    case level::trace:
        return spdlog::level::trace;
    case level::debug:
        return spdlog::level::debug;
    case level::info:
        return spdlog::level::info;
    case level::warn:
        return spdlog::level::warn;
    case level::error:
        return spdlog::level::err;
    case level::critical:
        return spdlog::level::critical;
    case level::silent:
        return spdlog::level::off;
    }
    neo_assert_always(invariant, false, "Unknown log level", magic_enum::enum_integer(l));
}

}  // namespace

void pdg::log::init_logger() noexcept {
    auto logger = spdlog::get("pdg");
    if (!logger) {
        logger = spdlog::stderr_color_mt("pdg");
    }
    // Filtering happens in pdg_log, before any formatting
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("[%^%-5l%$] %v");
    spdlog::set_default_logger(logger);
}

void pdg::log::log_print(level l, std::string_view msg) noexcept {
    spdlog::default_logger_raw()->log(to_spdlog(l), "{}", msg);
}
