#pragma once

#include <mona/controller/error.hpp>
#include <mona/controller/state.hpp>
#include <mona/protocol.hpp>
#include <mona/state_db.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>

namespace mona::controller {

/**
 * Applies transactions to the ledger host state one at a time.
 *
 * Each transaction runs in a temporary child of the head state. The child is
 * squashed into the head when every operation succeeds and dropped
 * otherwise, in which case the receipt is flagged as reverted and carries no
 * events.
 */
class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /**
   * Opens the head state, restoring it from the snapshot when one is given
   * and exists.
   */
  std::error_code open( const std::optional< std::filesystem::path >& snapshot = {} );
  std::error_code close();

  result< protocol::transaction_receipt > process( const protocol::transaction& transaction );

  /**
   * Runs a program against the head state without changing it. Any write
   * fails with reversion_errc::read_only_context.
   */
  result< protocol::program_output > read_program( const protocol::account& id,
                                                   const protocol::program_input& input = {},
                                                   const protocol::account& caller      = protocol::null_account ) const;

  /**
   * The number of transactions applied without reversion.
   */
  std::uint64_t revision() const;

private:
  state_db::database _db;
};

} // namespace mona::controller
