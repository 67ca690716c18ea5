#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/endian.hpp>

#include <mona/memory.hpp>
#include <mona/program/token.hpp>
#include <mona/protocol.hpp>

namespace mona::program {

static constexpr std::uint32_t supply_id    = 0;
static constexpr std::uint32_t balance_id   = 1;
static constexpr std::uint32_t allowance_id = 2;
static constexpr std::uint32_t role_id      = 3;
static constexpr std::uint32_t pause_id     = 4;

static constexpr std::string_view mint_event         = "token.mint";
static constexpr std::string_view burn_event         = "token.burn";
static constexpr std::string_view role_granted_event = "token.role_granted";
static constexpr std::string_view role_revoked_event = "token.role_revoked";
static constexpr std::string_view transfer_event     = "token.transfer";
static constexpr std::string_view approval_event     = "token.approval";
static constexpr std::string_view paused_event       = "token.paused";
static constexpr std::string_view unpaused_event     = "token.unpaused";

static constexpr std::byte flag_set{ 0x01 };

namespace {

std::error_code read_exact( system_interface* system, std::span< std::byte > buffer )
{
  auto length = system->read( file_descriptor::stdin, buffer );
  if( !length )
    return length.error();

  if( *length != buffer.size() )
    return program_errc::invalid_argument;

  return program_errc::ok;
}

std::error_code read_account( system_interface* system, protocol::account& account )
{
  return read_exact( system, memory::as_writable_bytes( account ) );
}

std::error_code read_amount( system_interface* system, protocol::amount& value )
{
  protocol::amount_bytes bytes{};
  if( auto error = read_exact( system, memory::as_writable_bytes( bytes ) ); error )
    return error;

  value = protocol::from_bytes( bytes );
  return program_errc::ok;
}

std::error_code write_amount( system_interface* system, const protocol::amount& value )
{
  auto bytes = protocol::to_bytes( value );
  return system->write( file_descriptor::stdout, memory::as_bytes( bytes ) );
}

std::error_code write_bool( system_interface* system, bool value )
{
  std::uint8_t byte = value ? 1 : 0;
  return system->write( file_descriptor::stdout, memory::as_bytes( byte ) );
}

protocol::amount read_stored_amount( std::span< const std::byte > object )
{
  if( !object.size() )
    return 0;

  if( object.size() != protocol::amount_length )
    throw std::runtime_error( "unexpected amount object size" );

  return protocol::from_bytes( object );
}

std::vector< std::byte > role_key( token::role r, const protocol::account& account )
{
  auto r_byte = std::to_underlying( r );
  return memory::concat( { memory::as_bytes( r_byte ), memory::as_bytes( account ) } );
}

std::error_code emit_transfer( system_interface* system,
                               const protocol::account& from,
                               const protocol::account& to,
                               const protocol::amount& value )
{
  auto value_bytes = protocol::to_bytes( value );
  return system->event( memory::as_bytes( transfer_event ),
                        memory::concat( { memory::as_bytes( from ), memory::as_bytes( to ), memory::as_bytes( value_bytes ) } ),
                        { from, to } );
}

std::error_code emit_role_event( system_interface* system,
                                 std::string_view name,
                                 token::role r,
                                 const protocol::account& account,
                                 const protocol::account& admin )
{
  auto r_byte = std::to_underlying( r );
  return system->event( memory::as_bytes( name ),
                        memory::concat( { memory::as_bytes( r_byte ), memory::as_bytes( account ), memory::as_bytes( admin ) } ),
                        { account } );
}

} // namespace

protocol::amount token::total_supply( system_interface* system )
{
  return read_stored_amount( system->get_object( supply_id, std::span< const std::byte >{} ) );
}

protocol::amount token::balance_of( system_interface* system, const protocol::account& account )
{
  return read_stored_amount( system->get_object( balance_id, account ) );
}

protocol::amount
token::allowance( system_interface* system, const protocol::account& owner, const protocol::account& spender )
{
  auto key = memory::concat( { memory::as_bytes( owner ), memory::as_bytes( spender ) } );
  return read_stored_amount( system->get_object( allowance_id, key ) );
}

bool token::is_paused( system_interface* system )
{
  auto object = system->get_object( pause_id, std::span< const std::byte >{} );
  return object.size() == 1 && object[ 0 ] == flag_set;
}

bool token::has_role( system_interface* system, role r, const protocol::account& account )
{
  auto object = system->get_object( role_id, role_key( r, account ) );
  return object.size() == 1 && object[ 0 ] == flag_set;
}

std::error_code token::set_total_supply( system_interface* system, const protocol::amount& supply )
{
  auto bytes = protocol::to_bytes( supply );
  return system->put_object( supply_id, std::span< const std::byte >{}, memory::as_bytes( bytes ) );
}

std::error_code
token::set_balance( system_interface* system, const protocol::account& account, const protocol::amount& balance )
{
  auto bytes = protocol::to_bytes( balance );
  return system->put_object( balance_id, account, memory::as_bytes( bytes ) );
}

std::error_code token::set_allowance( system_interface* system,
                                      const protocol::account& owner,
                                      const protocol::account& spender,
                                      const protocol::amount& value )
{
  auto key   = memory::concat( { memory::as_bytes( owner ), memory::as_bytes( spender ) } );
  auto bytes = protocol::to_bytes( value );
  return system->put_object( allowance_id, key, memory::as_bytes( bytes ) );
}

std::error_code token::set_paused( system_interface* system, bool paused )
{
  if( paused )
    return system->put_object( pause_id, std::span< const std::byte >{}, std::span( &flag_set, 1 ) );

  return system->remove_object( pause_id, std::span< const std::byte >{} );
}

std::error_code token::set_role( system_interface* system, role r, const protocol::account& account, bool member )
{
  if( member )
    return system->put_object( role_id, role_key( r, account ), std::span( &flag_set, 1 ) );

  return system->remove_object( role_id, role_key( r, account ) );
}

std::error_code token::require_role( system_interface* system, role r, const protocol::account& account )
{
  if( !has_role( system, r, account ) )
    return program_errc::unauthorized;

  return program_errc::ok;
}

std::error_code token::issue( system_interface* system, const protocol::account& to, const protocol::amount& value )
{
  if( protocol::is_null( to ) )
    return program_errc::invalid_argument;

  auto supply = total_supply( system );

  if( std::numeric_limits< protocol::amount >::max() - value < supply )
    return program_errc::overflow;

  auto to_balance = balance_of( system, to );

  if( auto error = set_total_supply( system, supply + value ); error )
    return error;

  if( auto error = set_balance( system, to, to_balance + value ); error )
    return error;

  return emit_transfer( system, protocol::null_account, to, value );
}

std::error_code token::move( system_interface* system,
                             const protocol::account& from,
                             const protocol::account& to,
                             const protocol::amount& value )
{
  auto from_balance = balance_of( system, from );

  if( from_balance < value )
    return program_errc::insufficient_balance;

  if( auto error = set_balance( system, from, from_balance - value ); error )
    return error;

  // Read after the debit so a transfer to self nets to zero
  auto to_balance = balance_of( system, to );

  if( auto error = set_balance( system, to, to_balance + value ); error )
    return error;

  return emit_transfer( system, from, to, value );
}

std::error_code token::grant( system_interface* system, role r )
{
  protocol::account account;
  if( auto error = read_account( system, account ); error )
    return error;

  const auto& caller = system->get_caller();

  if( auto error = require_role( system, role::admin, caller ); error )
    return error;

  if( auto error = set_role( system, r, account, true ); error )
    return error;

  return emit_role_event( system, role_granted_event, r, account, caller );
}

std::error_code token::revoke( system_interface* system, role r )
{
  protocol::account account;
  if( auto error = read_account( system, account ); error )
    return error;

  const auto& caller = system->get_caller();

  if( auto error = require_role( system, role::admin, caller ); error )
    return error;

  if( auto error = set_role( system, r, account, false ); error )
    return error;

  return emit_role_event( system, role_revoked_event, r, account, caller );
}

std::error_code token::query_role( system_interface* system, role r )
{
  protocol::account account;
  if( auto error = read_account( system, account ); error )
    return error;

  return write_bool( system, has_role( system, r, account ) );
}

std::error_code token::construct( system_interface* system )
{
  const auto& deployer = system->get_caller();

  for( auto r: { role::admin, role::minter, role::pauser } )
  {
    if( auto error = set_role( system, r, deployer, true ); error )
      return error;

    if( auto error = emit_role_event( system, role_granted_event, r, deployer, deployer ); error )
      return error;
  }

  return issue( system, deployer, protocol::scale( initial_supply, decimals ) );
}

std::error_code token::run( system_interface* system )
{
  std::uint32_t code = 0;
  if( auto error = read_exact( system, memory::as_writable_bytes( code ) ); error )
    return error;

  boost::endian::little_to_native_inplace( code );

  switch( code )
  {
    case std::to_underlying( instruction::name ):
      return system->write( file_descriptor::stdout, memory::as_bytes( name ) );
    case std::to_underlying( instruction::symbol ):
      return system->write( file_descriptor::stdout, memory::as_bytes( symbol ) );
    case std::to_underlying( instruction::decimals ):
      return system->write( file_descriptor::stdout, memory::as_bytes( decimals ) );
    case std::to_underlying( instruction::total_supply ):
      return write_amount( system, total_supply( system ) );
    case std::to_underlying( instruction::balance_of ):
      {
        protocol::account account;
        if( auto error = read_account( system, account ); error )
          return error;

        return write_amount( system, balance_of( system, account ) );
      }
    case std::to_underlying( instruction::allowance ):
      {
        protocol::account owner;
        protocol::account spender;

        if( auto error = read_account( system, owner ); error )
          return error;

        if( auto error = read_account( system, spender ); error )
          return error;

        return write_amount( system, allowance( system, owner, spender ) );
      }
    case std::to_underlying( instruction::paused ):
      return write_bool( system, is_paused( system ) );
    case std::to_underlying( instruction::is_admin ):
      return query_role( system, role::admin );
    case std::to_underlying( instruction::is_minter ):
      return query_role( system, role::minter );
    case std::to_underlying( instruction::is_pauser ):
      return query_role( system, role::pauser );
    case std::to_underlying( instruction::transfer ):
      {
        protocol::account to;
        protocol::amount value;

        if( auto error = read_account( system, to ); error )
          return error;

        if( auto error = read_amount( system, value ); error )
          return error;

        const auto& caller = system->get_caller();

        if( is_paused( system ) )
          return program_errc::paused;

        if( protocol::is_null( caller ) || protocol::is_null( to ) )
          return program_errc::invalid_argument;

        return move( system, caller, to, value );
      }
    case std::to_underlying( instruction::transfer_from ):
      {
        protocol::account from;
        protocol::account to;
        protocol::amount value;

        if( auto error = read_account( system, from ); error )
          return error;

        if( auto error = read_account( system, to ); error )
          return error;

        if( auto error = read_amount( system, value ); error )
          return error;

        const auto& caller = system->get_caller();

        if( is_paused( system ) )
          return program_errc::paused;

        if( protocol::is_null( from ) || protocol::is_null( to ) || protocol::is_null( caller ) )
          return program_errc::invalid_argument;

        auto remaining = allowance( system, from, caller );

        if( remaining < value )
          return program_errc::insufficient_allowance;

        if( balance_of( system, from ) < value )
          return program_errc::insufficient_balance;

        if( auto error = set_allowance( system, from, caller, remaining - value ); error )
          return error;

        return move( system, from, to, value );
      }
    case std::to_underlying( instruction::approve ):
      {
        protocol::account spender;
        protocol::amount value;

        if( auto error = read_account( system, spender ); error )
          return error;

        if( auto error = read_amount( system, value ); error )
          return error;

        const auto& caller = system->get_caller();

        if( protocol::is_null( caller ) || protocol::is_null( spender ) )
          return program_errc::invalid_argument;

        if( auto error = set_allowance( system, caller, spender, value ); error )
          return error;

        auto value_bytes = protocol::to_bytes( value );
        return system->event(
          memory::as_bytes( approval_event ),
          memory::concat( { memory::as_bytes( caller ), memory::as_bytes( spender ), memory::as_bytes( value_bytes ) } ),
          { caller, spender } );
      }
    case std::to_underlying( instruction::mint ):
      {
        protocol::account to;
        protocol::amount value;

        if( auto error = read_account( system, to ); error )
          return error;

        if( auto error = read_amount( system, value ); error )
          return error;

        const auto& caller = system->get_caller();

        if( auto error = require_role( system, role::minter, caller ); error )
          return error;

        if( auto error = issue( system, to, value ); error )
          return error;

        auto value_bytes = protocol::to_bytes( value );
        return system->event(
          memory::as_bytes( mint_event ),
          memory::concat( { memory::as_bytes( to ), memory::as_bytes( value_bytes ), memory::as_bytes( caller ) } ),
          { to } );
      }
    case std::to_underlying( instruction::burn ):
      {
        protocol::amount value;

        if( auto error = read_amount( system, value ); error )
          return error;

        const auto& caller = system->get_caller();

        auto from_balance = balance_of( system, caller );

        if( from_balance < value )
          return program_errc::insufficient_balance;

        auto supply = total_supply( system );

        if( supply < value )
          throw std::runtime_error( "total supply is less than an account balance" );

        if( auto error = set_balance( system, caller, from_balance - value ); error )
          return error;

        if( auto error = set_total_supply( system, supply - value ); error )
          return error;

        if( auto error = emit_transfer( system, caller, protocol::null_account, value ); error )
          return error;

        auto value_bytes = protocol::to_bytes( value );
        return system->event( memory::as_bytes( burn_event ),
                              memory::concat( { memory::as_bytes( caller ), memory::as_bytes( value_bytes ) } ),
                              { caller } );
      }
    case std::to_underlying( instruction::pause ):
      {
        const auto& caller = system->get_caller();

        if( auto error = require_role( system, role::pauser, caller ); error )
          return error;

        if( is_paused( system ) )
          return program_errc::paused;

        if( auto error = set_paused( system, true ); error )
          return error;

        return system->event( memory::as_bytes( paused_event ), memory::as_bytes( caller ), { caller } );
      }
    case std::to_underlying( instruction::unpause ):
      {
        const auto& caller = system->get_caller();

        if( auto error = require_role( system, role::pauser, caller ); error )
          return error;

        if( !is_paused( system ) )
          return program_errc::not_paused;

        if( auto error = set_paused( system, false ); error )
          return error;

        return system->event( memory::as_bytes( unpaused_event ), memory::as_bytes( caller ), { caller } );
      }
    case std::to_underlying( instruction::grant_admin_role ):
      return grant( system, role::admin );
    case std::to_underlying( instruction::revoke_admin_role ):
      return revoke( system, role::admin );
    case std::to_underlying( instruction::grant_minter_role ):
      return grant( system, role::minter );
    case std::to_underlying( instruction::revoke_minter_role ):
      return revoke( system, role::minter );
    case std::to_underlying( instruction::grant_pauser_role ):
      return grant( system, role::pauser );
    case std::to_underlying( instruction::revoke_pauser_role ):
      return revoke( system, role::pauser );
    default:
      return program_errc::invalid_instruction;
  }
}

} // namespace mona::program
