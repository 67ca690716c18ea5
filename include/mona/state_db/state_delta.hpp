#pragma once

#include <mona/state_db/object_store.hpp>
#include <mona/state_db/types.hpp>

#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <utility>

namespace mona::state_db {

/**
 * A state_delta holds the objects written since its parent. Reads fall
 * through to the parent chain unless the key was written or removed here.
 *
 * Only a root delta owns durable state. Child deltas are merged into their
 * parent with squash() or dropped with the last reference to them.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
public:
  state_delta()                     = default;
  state_delta( const state_delta& ) = delete;
  state_delta( state_delta&& )      = delete;
  ~state_delta()                    = default;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;

  template< std::ranges::range ValueType >
  void put( object_key&& key, const ValueType& value )
  {
    _tombstones.erase( key );
    _objects.insert_or_assign( std::move( key ), object_value( std::ranges::begin( value ), std::ranges::end( value ) ) );
  }

  /**
   * Returns true when a visible object was removed.
   */
  bool remove( object_key&& key );
  std::optional< std::span< const std::byte > > get( const object_key& key ) const;

  void squash();

  bool removed( const object_key& key ) const;
  bool root() const noexcept;

  std::uint64_t revision() const noexcept;
  void set_revision( std::uint64_t revision ) noexcept;

  const std::shared_ptr< state_delta >& parent() const noexcept;

  object_store& objects() noexcept;
  const object_store& objects() const noexcept;

  std::shared_ptr< state_delta > make_child();

private:
  std::shared_ptr< state_delta > _parent;
  object_store _objects;
  std::set< object_key > _tombstones;
};

} // namespace mona::state_db
