#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <variant>

#include <mona/protocol/account.hpp>
#include <mona/protocol/program.hpp>

namespace mona::protocol {

/**
 * Instantiates a native program of the given kind at the given address. The
 * transaction sender becomes the program's deployer.
 */
struct deploy_program
{
  account id{};
  std::string kind;

  bool validate() const noexcept;
};

struct call_program
{
  account id{};
  program_input input;

  bool validate() const noexcept;
};

using operation = std::variant< deploy_program, call_program >;

} // namespace mona::protocol

template< typename T >
concept Operation = std::same_as< mona::protocol::operation, T > || std::same_as< mona::protocol::deploy_program, T >
                    || std::same_as< mona::protocol::call_program, T >;
