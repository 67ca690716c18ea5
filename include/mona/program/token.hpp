#pragma once

#include <cstdint>
#include <string_view>

#include <mona/program/error.hpp>
#include <mona/program/program.hpp>
#include <mona/protocol.hpp>

namespace mona::program {

/**
 * The Monad Token ledger.
 *
 * A single fungible asset with a total supply, per account balances,
 * spending allowances, a global pause switch and three roles. Admins grant
 * and revoke roles, minters create supply and pausers stop transfers.
 */
struct token final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    name,
    symbol,
    decimals,
    total_supply,
    balance_of,
    allowance,
    paused,
    is_admin,
    is_minter,
    is_pauser,
    transfer,
    transfer_from,
    approve,
    mint,
    burn,
    pause,
    unpause,
    grant_admin_role,
    revoke_admin_role,
    grant_minter_role,
    revoke_minter_role,
    grant_pauser_role,
    revoke_pauser_role
  };

  enum class role : std::uint8_t
  {
    admin,
    minter,
    pauser
  };

  static constexpr std::string_view name        = "Monad Token";
  static constexpr std::string_view symbol      = "MONA";
  static constexpr std::uint8_t decimals        = 18;
  static constexpr std::uint64_t initial_supply = 100'000;

  token()               = default;
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  std::error_code construct( system_interface* system ) override;
  std::error_code run( system_interface* system ) override;

private:
  protocol::amount total_supply( system_interface* system );
  protocol::amount balance_of( system_interface* system, const protocol::account& account );
  protocol::amount
  allowance( system_interface* system, const protocol::account& owner, const protocol::account& spender );
  bool is_paused( system_interface* system );
  bool has_role( system_interface* system, role r, const protocol::account& account );

  std::error_code set_total_supply( system_interface* system, const protocol::amount& supply );
  std::error_code set_balance( system_interface* system, const protocol::account& account, const protocol::amount& balance );
  std::error_code set_allowance( system_interface* system,
                                 const protocol::account& owner,
                                 const protocol::account& spender,
                                 const protocol::amount& value );
  std::error_code set_paused( system_interface* system, bool paused );
  std::error_code set_role( system_interface* system, role r, const protocol::account& account, bool member );

  std::error_code require_role( system_interface* system, role r, const protocol::account& account );

  std::error_code issue( system_interface* system, const protocol::account& to, const protocol::amount& value );
  std::error_code move( system_interface* system,
                        const protocol::account& from,
                        const protocol::account& to,
                        const protocol::amount& value );

  std::error_code grant( system_interface* system, role r );
  std::error_code revoke( system_interface* system, role r );
  std::error_code query_role( system_interface* system, role r );
};

} // namespace mona::program
