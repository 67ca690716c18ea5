#include <algorithm>
#include <expected>
#include <ranges>
#include <stdexcept>
#include <string>
#include <variant>

#include <boost/locale/utf.hpp>

#include <mona/controller/execution_context.hpp>
#include <mona/controller/state.hpp>
#include <mona/log.hpp>
#include <mona/memory.hpp>

namespace mona::controller {

const program_registry_map execution_context::program_registry = []()
{
  program_registry_map registry;
  registry.emplace( "token", std::make_unique< program::token >() );
  return registry;
}();

constexpr auto event_name_limit = 128;

template< typename T >
bool validate_utf( std::basic_string_view< T > str )
{
  auto it = str.begin();
  while( it != str.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< T >::decode( it, str.end() );
    if( cp == boost::locale::utf::illegal )
      return false;
    else if( cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

namespace {

struct frame_guard
{
  std::optional< program_frame >& frame;

  ~frame_guard()
  {
    frame.reset();
  }
};

} // namespace

execution_context::execution_context( controller::intent intent ):
    _intent( intent )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

void execution_context::clear_state_node()
{
  _state_node.reset();
}

void execution_context::set_caller( const protocol::account& caller ) noexcept
{
  _caller = caller;
}

chronicler& execution_context::chronicler()
{
  return _chronicler;
}

result< protocol::transaction_receipt > execution_context::apply( const protocol::transaction& transaction )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  _caller = transaction.sender;

  auto head_node = _state_node;

  auto error = [ & ]() -> std::error_code
  {
    auto transaction_node = head_node->make_child();
    _state_node           = transaction_node;

    for( const auto& o: transaction.operations )
    {
      if( std::holds_alternative< protocol::deploy_program >( o ) )
      {
        if( auto error = apply( std::get< protocol::deploy_program >( o ) ); error )
          return error;
      }
      else if( std::holds_alternative< protocol::call_program >( o ) )
      {
        if( auto error = apply( std::get< protocol::call_program >( o ) ); error )
          return error;
      }
      else [[unlikely]]
      {
        return reversion_errc::unknown_operation;
      }
    }

    transaction_node->squash();
    return reversion_errc::ok;
  }();

  _state_node = head_node;

  protocol::transaction_receipt receipt;

  if( error )
  {
    if( error.category() == reversion_category() || error.category() == program::program_category() )
    {
      receipt.reverted = true;
      receipt.error    = error;
      _chronicler.clear_events();
      _chronicler.push_log( "transaction reverted: " + error.message() );
    }
    else
    {
      return std::unexpected( error );
    }
  }

  receipt.events = _chronicler.events();
  receipt.logs   = _chronicler.logs();

  return receipt;
}

std::error_code execution_context::apply( const protocol::deploy_program& op )
{
  if( _state_node->get( state::space::program_data(), op.id ) )
    return reversion_errc::program_exists;

  if( !program_registry.contains( op.kind ) )
    return reversion_errc::invalid_program;

  _state_node->put( state::space::program_data(), op.id, memory::as_bytes( op.kind ) );

  if( auto output = run_program( op.id, std::span< const std::byte >{}, entry_point::construct ); !output )
    return output.error();

  LOG_INFO( mona::log::instance(),
            "Deployed {} program at {} for {}",
            op.kind,
            mona::log::hex{ op.id.data(), op.id.size() },
            mona::log::hex{ _caller.data(), _caller.size() } );

  return reversion_errc::ok;
}

std::error_code execution_context::apply( const protocol::call_program& op )
{
  if( auto output = run_program( op.id, op.input.stdin ); !output )
    return output.error();

  return reversion_errc::ok;
}

result< program::program* > execution_context::load_program( const protocol::account& id ) const
{
  auto kind = _state_node->get( state::space::program_data(), id );

  if( !kind )
    return std::unexpected( reversion_errc::invalid_program );

  auto itr = program_registry.find( memory::as_string_view( *kind ) );
  if( itr == program_registry.end() )
    throw std::runtime_error( "deployed program kind is not registered" );

  return itr->second.get();
}

result< protocol::program_output >
execution_context::run_program( const protocol::account& id, std::span< const std::byte > stdin, entry_point entry )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _frame )
    throw std::runtime_error( "a program is already running" );

  auto program = load_program( id );
  if( !program )
    return std::unexpected( program.error() );

  _frame.emplace( program_frame{ .program_id = id, .stdin = stdin } );
  frame_guard guard{ _frame };

  std::error_code error;

  switch( entry )
  {
    case entry_point::construct:
      error = ( *program )->construct( this );
      break;
    case entry_point::run:
      error = ( *program )->run( this );
      break;
  }

  if( error )
    return std::unexpected( error );

  return protocol::program_output{ .stdout = std::move( _frame->stdout ) };
}

program_frame& execution_context::frame()
{
  if( !_frame )
    throw std::runtime_error( "no program is running" );

  return *_frame;
}

result< std::size_t > execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return std::unexpected( reversion_errc::bad_file_descriptor );

  auto& f            = frame();
  std::size_t length = std::min( buffer.size(), f.stdin.size() - f.input_offset );

  std::ranges::copy( f.stdin.subspan( f.input_offset, length ), buffer.begin() );
  f.input_offset += length;

  return length;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > bytes )
{
  if( fd == program::file_descriptor::stdout )
  {
    auto& output = frame().stdout;
    output.insert( output.end(), bytes.begin(), bytes.end() );
    return reversion_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    log( bytes );
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id ) const
{
  if( !_frame )
    throw std::runtime_error( "no program is running" );

  state_db::object_space space{ .system = false, .id = id };
  std::ranges::copy( _frame->program_id, space.address.begin() );

  return space;
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->put( create_object_space( id ), key, value );
  return reversion_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->remove( create_object_space( id ), key );
  return reversion_errc::ok;
}

void execution_context::log( std::span< const std::byte > message )
{
  _chronicler.push_log( std::string( memory::as_string_view( message ) ) );
}

std::error_code execution_context::event( std::span< const std::byte > name,
                                          std::span< const std::byte > data,
                                          const std::vector< std::span< const std::byte > >& impacted )
{
  if( name.size() == 0 )
    return reversion_errc::invalid_event_name;

  if( name.size() > event_name_limit )
    return reversion_errc::invalid_event_name;

  if( !validate_utf( memory::as_string_view( name ) ) )
    return reversion_errc::invalid_event_name;

  for( const auto& imp: impacted )
  {
    if( imp.size() != protocol::account_length )
      return reversion_errc::failure;
  }

  protocol::event event;
  event.source = frame().program_id;
  event.name   = std::string( memory::as_string_view( name ) );
  event.data   = std::vector( data.begin(), data.end() );

  for( const auto& imp: impacted )
  {
    event.impacted.emplace_back();
    std::ranges::copy( imp, event.impacted.back().begin() );
  }

  _chronicler.push_event( std::move( event ) );

  return reversion_errc::ok;
}

const protocol::account& execution_context::get_caller()
{
  return _caller;
}

} // namespace mona::controller
