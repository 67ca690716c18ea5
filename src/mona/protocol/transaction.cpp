#include <mona/protocol/transaction.hpp>

#include <variant>

namespace mona::protocol {

bool deploy_program::validate() const noexcept
{
  if( is_null( id ) )
    return false;

  return !kind.empty();
}

bool call_program::validate() const noexcept
{
  return !is_null( id );
}

bool transaction::validate() const noexcept
{
  if( is_null( sender ) )
    return false;

  if( operations.empty() )
    return false;

  for( const auto& operation: operations )
  {
    if( std::holds_alternative< deploy_program >( operation ) )
    {
      if( !std::get< deploy_program >( operation ).validate() )
        return false;
    }
    else if( std::holds_alternative< call_program >( operation ) )
    {
      if( !std::get< call_program >( operation ).validate() )
        return false;
    }
    else [[unlikely]]
      return false;
  }

  return true;
}

} // namespace mona::protocol
