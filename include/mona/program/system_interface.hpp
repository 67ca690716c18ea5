#pragma once

#include <mona/program/error.hpp>
#include <mona/protocol.hpp>

#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace mona::program {

enum class file_descriptor : std::uint8_t
{
  stdin,
  stdout,
  stderr
};

/**
 * The host services available to a running program. Objects are scoped to
 * the object space of the running program.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  /**
   * Copies up to buffer.size() bytes and returns the number of bytes copied.
   */
  virtual result< std::size_t > read( file_descriptor fd, std::span< std::byte > buffer ) = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > bytes ) = 0;

  /**
   * Returns an empty span when the object does not exist.
   */
  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;
  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;
  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key )          = 0;

  virtual void log( std::span< const std::byte > message )                                     = 0;
  virtual std::error_code event( std::span< const std::byte > name,
                                 std::span< const std::byte > data,
                                 const std::vector< std::span< const std::byte > >& impacted ) = 0;

  virtual const protocol::account& get_caller() = 0;
};

} // namespace mona::program
