#include <mona/controller/chronicler.hpp>

namespace mona::controller {

void chronicler::push_event( protocol::event&& ev )
{
  ev.sequence = _sequence++;
  _events.emplace_back( std::move( ev ) );
}

void chronicler::push_log( std::string&& message )
{
  _logs.emplace_back( std::move( message ) );
}

const std::vector< protocol::event >& chronicler::events() const noexcept
{
  return _events;
}

const std::vector< std::string >& chronicler::logs() const noexcept
{
  return _logs;
}

void chronicler::clear_events() noexcept
{
  _events.clear();
  _sequence = 0;
}

} // namespace mona::controller
