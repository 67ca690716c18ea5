#include <mona/state_db/object_store.hpp>

#include <utility>

namespace mona::state_db {

object_store::object_store( std::uint64_t revision ) noexcept:
    _revision( revision )
{}

std::optional< std::span< const std::byte > > object_store::find( const object_key& key ) const
{
  if( auto itr = _objects.find( key ); itr != _objects.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

void object_store::insert_or_assign( object_key&& key, object_value&& value )
{
  _objects.insert_or_assign( std::move( key ), std::move( value ) );
}

bool object_store::erase( const object_key& key )
{
  return _objects.erase( key ) > 0;
}

void object_store::absorb( object_store& other )
{
  if( &other == this )
    return;

  while( !other._objects.empty() )
  {
    auto node = other._objects.extract( other._objects.begin() );
    _objects.insert_or_assign( std::move( node.key() ), std::move( node.mapped() ) );
  }
}

std::size_t object_store::size() const noexcept
{
  return _objects.size();
}

bool object_store::empty() const noexcept
{
  return _objects.empty();
}

object_store::const_iterator object_store::begin() const noexcept
{
  return _objects.begin();
}

object_store::const_iterator object_store::end() const noexcept
{
  return _objects.end();
}

std::uint64_t object_store::revision() const noexcept
{
  return _revision;
}

void object_store::set_revision( std::uint64_t revision ) noexcept
{
  _revision = revision;
}

} // namespace mona::state_db
