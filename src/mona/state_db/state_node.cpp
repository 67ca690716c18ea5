#include <mona/state_db/state_delta.hpp>
#include <mona/state_db/state_node.hpp>

#include <stdexcept>
#include <utility>

namespace mona::state_db {

state_node::state_node( std::shared_ptr< state_delta > delta ) noexcept:
    _delta( std::move( delta ) )
{}

state_delta& state_node::writable_delta()
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  return *_delta;
}

const state_delta& state_node::readable_delta() const
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  return *_delta;
}

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return readable_delta().get( make_compound_key( space, key ) );
}

bool state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  return writable_delta().remove( make_compound_key( space, key ) );
}

temporary_state_node_ptr state_node::make_child()
{
  return std::make_shared< temporary_state_node >( writable_delta().make_child() );
}

std::uint64_t state_node::revision() const
{
  return readable_delta().revision();
}

permanent_state_node::permanent_state_node( std::shared_ptr< state_delta > delta ) noexcept:
    state_node( std::move( delta ) )
{}

void permanent_state_node::set_revision( std::uint64_t revision )
{
  writable_delta().set_revision( revision );
}

temporary_state_node::temporary_state_node( std::shared_ptr< state_delta > delta ) noexcept:
    state_node( std::move( delta ) )
{}

void temporary_state_node::squash()
{
  writable_delta().squash();
  _delta.reset();
}

} // namespace mona::state_db
