#include <mona/controller/controller.hpp>
#include <mona/controller/execution_context.hpp>
#include <mona/controller/state.hpp>

#include <mona/log.hpp>

#include <memory>

namespace mona::controller {

controller::controller() {}

controller::~controller()
{
  if( auto error = close(); error )
    LOG_ERROR( mona::log::instance(), "Failed to close controller: {}", error.message() );
}

std::error_code controller::open( const std::optional< std::filesystem::path >& snapshot )
{
  auto error = _db.open(
    []( state_db::state_node_ptr& )
    {
      LOG_INFO( mona::log::instance(), "Initialized new state database" );
    },
    snapshot );

  if( error )
    return error;

  LOG_INFO( mona::log::instance(), "Opened state database at revision {}", revision() );

  return controller_errc::ok;
}

std::error_code controller::close()
{
  if( !_db.is_open() )
    return controller_errc::ok;

  LOG_INFO( mona::log::instance(), "Closing state database at revision {}", revision() );
  return _db.close();
}

result< protocol::transaction_receipt > controller::process( const protocol::transaction& transaction )
{
  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  if( !transaction.validate() )
    return std::unexpected( controller_errc::malformed_transaction );

  LOG_DEBUG( mona::log::instance(),
             "Pushing transaction - Sender: {}, Operations: {}",
             mona::log::hex{ transaction.sender.data(), transaction.sender.size() },
             transaction.operations.size() );

  auto head = _db.root();

  execution_context context( intent::transaction_application );
  context.set_state_node( head );

  return context.apply( transaction )
    .and_then(
      [ & ]( auto&& receipt ) -> result< protocol::transaction_receipt >
      {
        if( receipt.reverted )
        {
          LOG_DEBUG( mona::log::instance(),
                     "Transaction reverted - Sender: {}, Error: {}",
                     mona::log::hex{ transaction.sender.data(), transaction.sender.size() },
                     receipt.error.message() );
        }
        else
        {
          head->set_revision( head->revision() + 1 );
          LOG_DEBUG( mona::log::instance(),
                     "Transaction applied - Sender: {}, Revision: {}",
                     mona::log::hex{ transaction.sender.data(), transaction.sender.size() },
                     head->revision() );
        }

        return receipt;
      } );
}

result< protocol::program_output > controller::read_program( const protocol::account& id,
                                                             const protocol::program_input& input,
                                                             const protocol::account& caller ) const
{
  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  execution_context context( intent::read_only );
  context.set_state_node( _db.root()->make_child() );
  context.set_caller( caller );

  return context.run_program( id, input.stdin );
}

std::uint64_t controller::revision() const
{
  if( !_db.is_open() )
    return 0;

  return _db.root()->revision();
}

} // namespace mona::controller
