#include <mona/state_db/state_delta.hpp>

#include <stdexcept>

namespace mona::state_db {

bool state_delta::remove( object_key&& key )
{
  if( !get( key ) )
    return false;

  _objects.erase( key );

  // A root has nothing beneath it to shadow
  if( !root() )
    _tombstones.insert( std::move( key ) );

  return true;
}

std::optional< std::span< const std::byte > > state_delta::get( const object_key& key ) const
{
  for( auto delta = this; delta; delta = delta->_parent.get() )
  {
    if( delta->removed( key ) )
      return {};

    if( auto value = delta->_objects.find( key ); value )
      return value;
  }

  return {};
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash a root state delta" );

  auto& parent = *_parent;

  for( const auto& key: _tombstones )
    parent._objects.erase( key );

  if( !parent.root() )
  {
    for( const auto& [ key, value ]: _objects )
      parent._tombstones.erase( key );

    parent._tombstones.merge( _tombstones );
  }

  parent._objects.absorb( _objects );
  _tombstones.clear();
}

bool state_delta::removed( const object_key& key ) const
{
  return _tombstones.contains( key );
}

bool state_delta::root() const noexcept
{
  return !_parent;
}

std::uint64_t state_delta::revision() const noexcept
{
  return _objects.revision();
}

void state_delta::set_revision( std::uint64_t revision ) noexcept
{
  _objects.set_revision( revision );
}

const std::shared_ptr< state_delta >& state_delta::parent() const noexcept
{
  return _parent;
}

object_store& state_delta::objects() noexcept
{
  return _objects;
}

const object_store& state_delta::objects() const noexcept
{
  return _objects;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  auto child     = std::make_shared< state_delta >();
  child->_parent = shared_from_this();
  child->_objects.set_revision( revision() );
  return child;
}

} // namespace mona::state_db
