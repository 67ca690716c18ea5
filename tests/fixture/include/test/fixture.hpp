#pragma once

#include <ranges>

#include <boost/endian.hpp>
#include <boost/filesystem.hpp>

#include <mona/controller.hpp>
#include <mona/memory.hpp>
#include <mona/program.hpp>
#include <mona/protocol.hpp>

#include <filesystem>

namespace test {

namespace token {

using instruction = mona::program::token::instruction;
using role        = mona::program::token::role;

} // namespace token

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  mona::protocol::operation make_deploy_operation( const mona::protocol::account& id, const std::string& kind ) const;

  template< typename... Args >
  mona::protocol::operation make_call_operation( const mona::protocol::account& id, Args... args ) const
  {
    mona::protocol::call_program op;
    op.id          = id;
    op.input.stdin = make_stdin( std::forward< Args >( args )... );
    return op;
  }

  template< Operation... Args >
  mona::protocol::transaction make_transaction( const mona::protocol::account& sender, Args... args ) const
  {
    mona::protocol::transaction t;
    ( ( t.operations.emplace_back( std::forward< Args >( args ) ) ), ... );
    t.sender = sender;
    return t;
  }

  template< std::integral T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = mona::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  void append_stdin( std::vector< std::byte >& input, const mona::protocol::account& a ) const noexcept
  {
    input.insert( input.end(), a.begin(), a.end() );
  }

  void append_stdin( std::vector< std::byte >& input, const mona::protocol::amount& a ) const
  {
    const auto bytes = mona::protocol::to_bytes( a );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_stdin( input, std::to_underlying( t ) );
  }

  template< typename... Args >
  std::vector< std::byte > make_stdin( Args... args ) const
  {
    std::vector< std::byte > input;
    ( ( append_stdin( input, std::forward< Args >( args ) ) ), ... );
    return input;
  }

  mona::protocol::program_input make_input( std::vector< std::byte >&& stdin ) const noexcept;

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    without_reversion = 1 << 1,
    with_reversion    = 1 << 2
  };

  bool verify( mona::controller::result< mona::protocol::transaction_receipt > receipt, std::uint64_t flags ) const;

  mona::protocol::amount total_supply() const;
  mona::protocol::amount balance_of( const mona::protocol::account& account ) const;
  mona::protocol::amount allowance( const mona::protocol::account& owner, const mona::protocol::account& spender ) const;
  bool paused() const;
  bool has_role( token::role r, const mona::protocol::account& account ) const;

  /**
   * Reopens the controller from the snapshot written on close.
   */
  void restart();

  static mona::protocol::amount tokens( std::uint64_t whole_tokens );

  const mona::protocol::account ledger   = mona::protocol::system_account( "mona.token" );
  const mona::protocol::account deployer = mona::protocol::system_account( "deployer" );
  const mona::protocol::account alice    = mona::protocol::system_account( "alice" );
  const mona::protocol::account bob      = mona::protocol::system_account( "bob" );
  const mona::protocol::account carol    = mona::protocol::system_account( "carol" );

  std::unique_ptr< mona::controller::controller > _controller;
  std::filesystem::path _state_dir;
};

} // namespace test
