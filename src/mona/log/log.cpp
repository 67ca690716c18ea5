#include <mona/log/log.hpp>

#include <chrono>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/core/LogLevel.h>
#include <quill/sinks/ConsoleSink.h>

namespace mona::log {

void initialize( std::string_view level )
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  auto log_level = quill::loglevel_from_string( std::string( level ) );

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( mona::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );

  instance()->set_log_level( log_level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

} // namespace mona::log
