#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <mona/log/formatter.hpp>
#include <mona/log/frontend.hpp>

namespace mona::log {

/**
 * Starts the logging backend and applies the filtering level to the root
 * logger. Throws if the level is not a quill level name.
 */
void initialize( std::string_view level = "info" );
logger* instance() noexcept;

} // namespace mona::log
