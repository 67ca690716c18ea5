#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace mona::state_db {

using object_key   = std::vector< std::byte >;
using object_value = std::vector< std::byte >;

/**
 * An ordered in-memory collection of objects under their compound keys,
 * stamped with the revision of the state it belongs to.
 */
class object_store final
{
public:
  using container_type = std::map< object_key, object_value >;
  using const_iterator = container_type::const_iterator;

  object_store() = default;
  explicit object_store( std::uint64_t revision ) noexcept;

  std::optional< std::span< const std::byte > > find( const object_key& key ) const;
  void insert_or_assign( object_key&& key, object_value&& value );
  bool erase( const object_key& key );

  /**
   * Moves every object held by other into this store. Objects already
   * present under the same key are replaced. other is left empty.
   */
  void absorb( object_store& other );

  std::size_t size() const noexcept;
  bool empty() const noexcept;

  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

  std::uint64_t revision() const noexcept;
  void set_revision( std::uint64_t revision ) noexcept;

private:
  container_type _objects;
  std::uint64_t _revision = 0;
};

} // namespace mona::state_db
