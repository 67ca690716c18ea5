#pragma once

#include <mona/state_db/error.hpp>
#include <mona/state_db/state_node.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

namespace mona::state_db {

/**
 * database owns the root state of the ledger host.
 *
 * Writers never touch the root directly. They create a temporary child with
 * root()->make_child(), write into it, and either squash it into the root or
 * drop it, which discards every write made through it.
 *
 * When opened with a path the root state is restored from a snapshot file
 * at that path, or produced by the genesis initializer when no snapshot
 * exists yet. close() writes the root state back to the snapshot.
 *
 * database is not thread safe. Callers serialize access.
 */
class database final
{
public:
  database() noexcept;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database.
   */
  std::error_code open( genesis_init_function init, const std::optional< std::filesystem::path >& path = {} );

  /**
   * Close the database, writing the snapshot when a path was given. When
   * the snapshot cannot be written the database stays open with its state
   * intact and close() may be called again.
   */
  std::error_code close();

  bool is_open() const noexcept;

  /**
   * Get and return the current "root" node.
   */
  permanent_state_node_ptr root() const;

private:
  std::error_code load_snapshot( const std::filesystem::path& path );
  std::error_code store_snapshot( const std::filesystem::path& path ) const;

  std::shared_ptr< state_delta > _root;
  std::optional< std::filesystem::path > _path;
};

} // namespace mona::state_db
