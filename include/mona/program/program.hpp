#pragma once

#include <system_error>

#include <mona/program/system_interface.hpp>

namespace mona::program {

struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  /**
   * Runs once when the program is deployed, with the deployer as caller.
   */
  virtual std::error_code construct( system_interface* system ) = 0;

  virtual std::error_code run( system_interface* system ) = 0;
};

} // namespace mona::program
