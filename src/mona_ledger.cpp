#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/endian.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <mona/controller.hpp>
#include <mona/encode.hpp>
#include <mona/log.hpp>
#include <mona/memory.hpp>
#include <mona/program.hpp>
#include <mona/protocol.hpp>

namespace constants {

using namespace std::string_literals;

const auto service = "mona_ledger"s;

const auto help_option              = "help,h"s;
const auto basedir_option           = "basedir,d"s;
const auto basedir_default          = "."s;
const auto log_level_option         = "log-level,l"s;
const auto log_level_default        = "info"s;
const auto statedir_option          = "statedir"s;
const auto statedir_default         = "state"s;
const auto deployer_option          = "deployer"s;
const auto ledger_address_option    = "ledger-address"s;
const auto ledger_address_default   = ""s;
const auto script_option            = "script,s"s;
const auto script_default           = ""s;
const auto deployer_environment_var = "MONA_DEPLOYER";
const auto snapshot_file            = "state.bin"s;
const auto program_kind             = "token"s;

constexpr auto default_ledger_address = mona::protocol::system_account( "mona.token" );

} // namespace constants

namespace program_options = boost::program_options;

using namespace mona;

using instruction = program::token::instruction;

namespace {

const std::map< std::string, instruction, std::less<> > instructions = {
  {              "name",               instruction::name },
  {            "symbol",             instruction::symbol },
  {          "decimals",           instruction::decimals },
  {      "total_supply",       instruction::total_supply },
  {        "balance_of",         instruction::balance_of },
  {         "allowance",          instruction::allowance },
  {            "paused",             instruction::paused },
  {          "is_admin",           instruction::is_admin },
  {         "is_minter",          instruction::is_minter },
  {         "is_pauser",          instruction::is_pauser },
  {          "transfer",           instruction::transfer },
  {     "transfer_from",      instruction::transfer_from },
  {           "approve",            instruction::approve },
  {              "mint",               instruction::mint },
  {              "burn",               instruction::burn },
  {             "pause",              instruction::pause },
  {           "unpause",            instruction::unpause },
  {  "grant_admin_role",   instruction::grant_admin_role },
  { "revoke_admin_role",  instruction::revoke_admin_role },
  { "grant_minter_role",  instruction::grant_minter_role },
  {"revoke_minter_role", instruction::revoke_minter_role },
  { "grant_pauser_role",  instruction::grant_pauser_role },
  {"revoke_pauser_role", instruction::revoke_pauser_role }
};

/**
 * Command line arguments take precedence over the service section of the
 * config file, which takes precedence over the global section.
 */
template< typename T >
T get_option( std::string key,
              T default_value,
              const program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  if( auto pos = key.find( ',' ); pos != std::string::npos )
    key = key.substr( 0, pos );

  if( cli_args.count( key ) )
    return cli_args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

protocol::account parse_account( const std::string& str )
{
  auto account = protocol::account_from_hex( str );
  if( !account )
    throw std::runtime_error( "invalid account '" + str + "': " + account.error().message() );

  return *account;
}

/**
 * Script arguments are either hex accounts (0x prefixed) or base ten amounts.
 */
void append_argument( std::vector< std::byte >& input, const std::string& arg )
{
  if( arg.starts_with( "0x" ) || arg.starts_with( "0X" ) )
  {
    auto account = parse_account( arg );
    input.insert( input.end(), account.begin(), account.end() );
    return;
  }

  auto value = protocol::amount_from_string( arg );
  if( !value )
    throw std::runtime_error( "invalid amount '" + arg + "': " + value.error().message() );

  auto bytes = protocol::to_bytes( *value );
  input.insert( input.end(), bytes.begin(), bytes.end() );
}

std::vector< std::byte > make_input( instruction i, const std::vector< std::string >& args )
{
  auto number = boost::endian::native_to_little( std::to_underlying( i ) );
  auto bytes  = memory::as_bytes( number );

  std::vector< std::byte > input( bytes.begin(), bytes.end() );
  for( const auto& arg: args )
    append_argument( input, arg );

  return input;
}

bool is_query( instruction i )
{
  return std::to_underlying( i ) <= std::to_underlying( instruction::is_pauser );
}

controller::result< protocol::program_output >
query( const controller::controller& controller, const protocol::account& ledger, instruction i )
{
  protocol::program_input input;
  input.stdin = make_input( i, {} );
  return controller.read_program( ledger, input );
}

void log_receipt( const protocol::transaction_receipt& receipt )
{
  if( receipt.reverted )
  {
    LOG_WARNING( mona::log::instance(), "Transaction reverted: {}", receipt.error.message() );
    return;
  }

  for( const auto& event: receipt.events )
    LOG_INFO( mona::log::instance(),
              "Event #{} {}: {}",
              event.sequence,
              event.name,
              mona::log::hex{ event.data.data(), event.data.size() } );
}

std::error_code deploy( controller::controller& controller,
                        const protocol::account& deployer,
                        const protocol::account& ledger )
{
  if( auto output = query( controller, ledger, instruction::name ); output )
  {
    LOG_INFO( mona::log::instance(), "Ledger is already deployed at {}", mona::log::hex{ ledger.data(), ledger.size() } );
    return controller::controller_errc::ok;
  }
  else if( output.error() != controller::reversion_errc::invalid_program )
  {
    return output.error();
  }

  protocol::transaction transaction;
  transaction.sender = deployer;
  transaction.operations.emplace_back( protocol::deploy_program{ .id = ledger, .kind = constants::program_kind } );

  auto receipt = controller.process( transaction );
  if( !receipt )
    return receipt.error();

  log_receipt( *receipt );

  if( receipt->reverted )
    return receipt->error;

  return controller::controller_errc::ok;
}

void log_ledger( const controller::controller& controller, const protocol::account& ledger )
{
  auto name   = query( controller, ledger, instruction::name );
  auto symbol = query( controller, ledger, instruction::symbol );
  auto supply = query( controller, ledger, instruction::total_supply );

  if( !name || !symbol || !supply )
    throw std::runtime_error( "unable to query the ledger" );

  LOG_INFO( mona::log::instance(),
            "Ledger {} - Name: {}, Symbol: {}, Total supply: {}",
            mona::log::hex{ ledger.data(), ledger.size() },
            std::string( memory::as_string_view( name->stdout ) ),
            std::string( memory::as_string_view( symbol->stdout ) ),
            mona::log::amount{ protocol::from_bytes( supply->stdout ) } );
}

void run_script( controller::controller& controller,
                 const std::filesystem::path& script,
                 const protocol::account& deployer,
                 const protocol::account& ledger )
{
  auto calls = YAML::LoadFile( script.string() )[ "calls" ];
  if( !calls )
  {
    LOG_WARNING( mona::log::instance(), "Script {} contains no calls", script.string() );
    return;
  }

  for( const auto& call: calls )
  {
    auto name = call[ "instruction" ].as< std::string >();
    auto itr  = instructions.find( name );
    if( itr == instructions.end() )
      throw std::runtime_error( "unknown instruction '" + name + "'" );

    auto sender = call[ "sender" ] ? parse_account( call[ "sender" ].as< std::string >() ) : deployer;
    auto args   = call[ "args" ] ? call[ "args" ].as< std::vector< std::string > >() : std::vector< std::string >();

    LOG_INFO( mona::log::instance(), "Calling {} as {}", name, mona::log::hex{ sender.data(), sender.size() } );

    if( is_query( itr->second ) )
    {
      protocol::program_input input;
      input.stdin = make_input( itr->second, args );

      if( auto output = controller.read_program( ledger, input, sender ); output )
        LOG_INFO( mona::log::instance(),
                  "Result: {}",
                  mona::log::hex{ output->stdout.data(), output->stdout.size() } );
      else
        LOG_WARNING( mona::log::instance(), "Query failed: {}", output.error().message() );

      continue;
    }

    protocol::transaction transaction;
    transaction.sender = sender;
    transaction.operations.emplace_back(
      protocol::call_program{ .id = ledger, .input = protocol::program_input{ .stdin = make_input( itr->second, args ) } } );

    if( auto receipt = controller.process( transaction ); receipt )
      log_receipt( *receipt );
    else
      LOG_WARNING( mona::log::instance(), "Transaction rejected: {}", receipt.error().message() );
  }
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level, deployer_option, ledger_option, script_option;
  std::filesystem::path basedir, statedir;
  protocol::account deployer{}, ledger{};

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()          , "Print this help message and exit" )
      ( constants::basedir_option.data()       , program_options::value< std::string >()->default_value( constants::basedir_default ), "Base directory holding config.yml" )
      ( constants::log_level_option.data()     , program_options::value< std::string >(), "The log filtering level" )
      ( constants::statedir_option.data()      , program_options::value< std::string >(), "The location of the ledger state (absolute path or relative to basedir)" )
      ( constants::deployer_option.data()      , program_options::value< std::string >(), "The deploying account, overrides MONA_DEPLOYER" )
      ( constants::ledger_address_option.data(), program_options::value< std::string >(), "The address the ledger is deployed at" )
      ( constants::script_option.data()        , program_options::value< std::string >(), "A YAML script of calls to apply" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node service_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config         = YAML::LoadFile( yaml_config.string() );
      global_config  = config[ "global" ];
      service_config = config[ constants::service ];
    }

    std::string deployer_default;
    if( const char* env = std::getenv( constants::deployer_environment_var ); env != nullptr )
      deployer_default = env;

    // clang-format off
    log_level       = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, service_config, global_config );
    statedir        = std::filesystem::path( get_option< std::string >( constants::statedir_option, constants::statedir_default, args, service_config, global_config ) );
    deployer_option = get_option< std::string >( constants::deployer_option, deployer_default, args, service_config, global_config );
    ledger_option   = get_option< std::string >( constants::ledger_address_option, constants::ledger_address_default, args, service_config, global_config );
    script_option   = get_option< std::string >( constants::script_option, constants::script_default, args, service_config, global_config );
    // clang-format on

    mona::log::initialize( log_level );

    if( config.IsNull() )
      LOG_WARNING( mona::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( deployer_option.empty() )
      throw std::runtime_error( "a deployer account is required (--deployer or MONA_DEPLOYER)" );

    deployer = parse_account( deployer_option );
    ledger   = ledger_option.empty() ? constants::default_ledger_address : parse_account( ledger_option );

    if( statedir.is_relative() )
      statedir = basedir / statedir;

    if( !std::filesystem::exists( statedir ) )
      std::filesystem::create_directories( statedir );
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  controller::controller controller;

  try
  {
    if( auto error = controller.open( statedir / constants::snapshot_file ); error )
      throw std::runtime_error( "unable to open state: " + error.message() );

    if( auto error = deploy( controller, deployer, ledger ); error )
      throw std::runtime_error( "unable to deploy ledger: " + error.message() );

    log_ledger( controller, ledger );

    if( !script_option.empty() )
    {
      auto script = std::filesystem::path( script_option );
      if( script.is_relative() )
        script = basedir / script;

      run_script( controller, script, deployer, ledger );
      log_ledger( controller, ledger );
    }
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( mona::log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  if( auto error = controller.close(); error )
  {
    LOG_ERROR( mona::log::instance(), "Failed to persist state: {}", error.message() );
    retcode = EXIT_FAILURE;
  }

  LOG_INFO( mona::log::instance(), "Shut down gracefully" );

  return retcode;
}
