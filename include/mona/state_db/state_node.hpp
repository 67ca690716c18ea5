#pragma once

#include <mona/memory.hpp>
#include <mona/state_db/state_delta.hpp>
#include <mona/state_db/types.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>

namespace mona::state_db {

inline object_key make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  object_key compound_key;
  compound_key.reserve( sizeof( space ) + key.size() );
  std::ranges::copy( memory::as_bytes( space ), std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

/**
 * A view of the ledger state addressed by object space and key.
 */
class state_node
{
public:
  state_node( const state_node& node ) = delete;
  state_node( state_node&& node )      = delete;
  virtual ~state_node()                = default;

  state_node& operator=( const state_node& node ) = delete;
  state_node& operator=( state_node&& node )      = delete;

  std::optional< std::span< const std::byte > > get( const object_space& space,
                                                     std::span< const std::byte > key ) const;

  template< std::ranges::range ValueType >
  void put( const object_space& space, std::span< const std::byte > key, const ValueType& value )
  {
    writable_delta().put( make_compound_key( space, key ), value );
  }

  /**
   * Returns true when an object was removed.
   */
  bool remove( const object_space& space, std::span< const std::byte > key );

  /**
   * Returns a temporary child whose writes stay invisible to this node until
   * it is squashed.
   */
  temporary_state_node_ptr make_child();

  std::uint64_t revision() const;

protected:
  explicit state_node( std::shared_ptr< state_delta > delta ) noexcept;

  state_delta& writable_delta();
  const state_delta& readable_delta() const;

  std::shared_ptr< state_delta > _delta;
};

/**
 * The head state. Writes land directly in the root delta.
 */
class permanent_state_node final: public state_node
{
public:
  explicit permanent_state_node( std::shared_ptr< state_delta > delta ) noexcept;
  permanent_state_node( const permanent_state_node& node ) = delete;
  permanent_state_node( permanent_state_node&& node )      = delete;
  ~permanent_state_node() override                         = default;

  permanent_state_node& operator=( const permanent_state_node& node ) = delete;
  permanent_state_node& operator=( permanent_state_node&& node )      = delete;

  void set_revision( std::uint64_t revision );
};

class temporary_state_node final: public state_node
{
public:
  explicit temporary_state_node( std::shared_ptr< state_delta > delta ) noexcept;
  temporary_state_node( const temporary_state_node& ) = delete;
  temporary_state_node( temporary_state_node&& )      = delete;
  ~temporary_state_node() override                    = default;

  temporary_state_node& operator=( const temporary_state_node& ) = delete;
  temporary_state_node& operator=( temporary_state_node&& )      = delete;

  /**
   * Merges this node's writes into its parent. The node is unusable
   * afterwards.
   */
  void squash();
};

} // namespace mona::state_db
