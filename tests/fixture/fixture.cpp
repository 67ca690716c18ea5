// NOLINTBEGIN

#include <test/fixture.hpp>

#include <stdexcept>

#include <mona/controller.hpp>
#include <mona/encode.hpp>
#include <mona/log.hpp>
#include <mona/protocol.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  mona::log::initialize( log_level );

  _controller = std::make_unique< mona::controller::controller >();

  _state_dir = std::filesystem::temp_directory_path() / boost::filesystem::unique_path().string();
  LOG_INFO( mona::log::instance(), "Using temporary directory for {}: {}", name, _state_dir.string() );
  std::filesystem::create_directory( _state_dir );

  if( auto error = _controller->open( _state_dir / "state.bin" ); error )
    throw std::runtime_error( "unable to open controller: " + error.message() );

  if( !verify( _controller->process( make_transaction( deployer, make_deploy_operation( ledger, "token" ) ) ),
               verification::processed | verification::without_reversion ) )
    throw std::runtime_error( "unable to deploy the ledger" );
}

fixture::~fixture()
{
  _controller.reset();
  std::filesystem::remove_all( _state_dir );
}

mona::protocol::operation fixture::make_deploy_operation( const mona::protocol::account& id,
                                                          const std::string& kind ) const
{
  mona::protocol::deploy_program op;
  op.id   = id;
  op.kind = kind;
  return op;
}

mona::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin ) const noexcept
{
  mona::protocol::program_input input;
  input.stdin = std::move( stdin );
  return input;
}

bool fixture::verify( mona::controller::result< mona::protocol::transaction_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( mona::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::without_reversion )
  {
    if( receipt->reverted )
    {
      LOG_ERROR( mona::log::instance(), "Transaction was reverted: {}", receipt->error.message() );
      return false;
    }
  }

  if( flags & verification::with_reversion )
  {
    if( !receipt->reverted )
    {
      LOG_ERROR( mona::log::instance(), "Transaction was expected to revert" );
      return false;
    }

    if( !receipt->events.empty() )
    {
      LOG_ERROR( mona::log::instance(), "Reverted transaction recorded {} event(s)", receipt->events.size() );
      return false;
    }
  }

  return true;
}

mona::protocol::amount fixture::total_supply() const
{
  auto response = _controller->read_program( ledger, make_input( make_stdin( token::instruction::total_supply ) ) );
  if( !response )
    throw std::runtime_error( response.error().message() );

  return mona::protocol::from_bytes( response->stdout );
}

mona::protocol::amount fixture::balance_of( const mona::protocol::account& account ) const
{
  auto response =
    _controller->read_program( ledger, make_input( make_stdin( token::instruction::balance_of, account ) ) );
  if( !response )
    throw std::runtime_error( response.error().message() );

  return mona::protocol::from_bytes( response->stdout );
}

mona::protocol::amount fixture::allowance( const mona::protocol::account& owner,
                                           const mona::protocol::account& spender ) const
{
  auto response =
    _controller->read_program( ledger, make_input( make_stdin( token::instruction::allowance, owner, spender ) ) );
  if( !response )
    throw std::runtime_error( response.error().message() );

  return mona::protocol::from_bytes( response->stdout );
}

bool fixture::paused() const
{
  auto response = _controller->read_program( ledger, make_input( make_stdin( token::instruction::paused ) ) );
  if( !response || response->stdout.size() != 1 )
    throw std::runtime_error( "unexpected paused response" );

  return response->stdout[ 0 ] == std::byte{ 0x01 };
}

bool fixture::has_role( token::role r, const mona::protocol::account& account ) const
{
  token::instruction i = token::instruction::is_admin;

  switch( r )
  {
    case token::role::admin:
      i = token::instruction::is_admin;
      break;
    case token::role::minter:
      i = token::instruction::is_minter;
      break;
    case token::role::pauser:
      i = token::instruction::is_pauser;
      break;
  }

  auto response = _controller->read_program( ledger, make_input( make_stdin( i, account ) ) );
  if( !response || response->stdout.size() != 1 )
    throw std::runtime_error( "unexpected role response" );

  return response->stdout[ 0 ] == std::byte{ 0x01 };
}

void fixture::restart()
{
  if( auto error = _controller->close(); error )
    throw std::runtime_error( "unable to close controller: " + error.message() );

  _controller = std::make_unique< mona::controller::controller >();

  if( auto error = _controller->open( _state_dir / "state.bin" ); error )
    throw std::runtime_error( "unable to reopen controller: " + error.message() );
}

mona::protocol::amount fixture::tokens( std::uint64_t whole_tokens )
{
  return mona::protocol::scale( whole_tokens, mona::program::token::decimals );
}

} // namespace test

// NOLINTEND
