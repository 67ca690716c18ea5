#pragma once

#include <mona/protocol.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace mona::controller {

/**
 * Records the events and logs produced while applying a transaction, in
 * emission order.
 */
class chronicler final
{
public:
  void push_event( protocol::event&& ev );
  void push_log( std::string&& message );

  const std::vector< protocol::event >& events() const noexcept;
  const std::vector< std::string >& logs() const noexcept;

  void clear_events() noexcept;

private:
  std::vector< protocol::event > _events;
  std::vector< std::string > _logs;
  std::uint32_t _sequence = 0;
};

} // namespace mona::controller
