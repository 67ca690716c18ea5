#pragma once

#include <mona/controller/chronicler.hpp>
#include <mona/controller/error.hpp>
#include <mona/controller/state.hpp>
#include <mona/program.hpp>
#include <mona/protocol.hpp>
#include <mona/state_db.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mona::controller {

using program_registry_map = std::map< std::string, std::unique_ptr< program::program >, std::less<> >;

enum class intent : std::uint8_t
{
  read_only,
  transaction_application
};

enum class entry_point : std::uint8_t
{
  construct,
  run
};

struct program_frame
{
  protocol::account program_id{};
  std::span< const std::byte > stdin;
  std::size_t input_offset = 0;
  std::vector< std::byte > stdout;
};

class execution_context final: public program::system_interface
{
public:
  execution_context( intent i = intent::read_only );
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  ~execution_context() final                    = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  void set_state_node( const state_db::state_node_ptr& );
  void clear_state_node();

  void set_caller( const protocol::account& caller ) noexcept;

  class chronicler& chronicler();

  result< protocol::transaction_receipt > apply( const protocol::transaction& );

  result< protocol::program_output >
  run_program( const protocol::account& id, std::span< const std::byte > stdin, entry_point entry = entry_point::run );

  result< std::size_t > read( program::file_descriptor fd, std::span< std::byte > buffer ) final;
  std::error_code write( program::file_descriptor fd, std::span< const std::byte > bytes ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;
  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;
  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  void log( std::span< const std::byte > message ) final;
  std::error_code event( std::span< const std::byte > name,
                         std::span< const std::byte > data,
                         const std::vector< std::span< const std::byte > >& impacted ) final;

  const protocol::account& get_caller() final;

private:
  std::error_code apply( const protocol::deploy_program& );
  std::error_code apply( const protocol::call_program& );

  result< program::program* > load_program( const protocol::account& id ) const;
  state_db::object_space create_object_space( std::uint32_t id ) const;
  program_frame& frame();

  state_db::state_node_ptr _state_node;
  std::optional< program_frame > _frame;
  protocol::account _caller{};
  class chronicler _chronicler;
  intent _intent;

  static const program_registry_map program_registry;
};

} // namespace mona::controller
