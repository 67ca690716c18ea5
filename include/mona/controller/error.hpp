#pragma once

#include <expected>
#include <system_error>

namespace mona::controller {

/**
 * Errors that revert the transaction. The transaction still produces a
 * receipt, flagged as reverted.
 */
enum class reversion_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  failure,
  invalid_program,
  program_exists,
  invalid_event_name,
  unknown_operation,
  read_only_context,
  bad_file_descriptor
};

/**
 * Errors that reject the transaction outright.
 */
enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  malformed_transaction,
  not_open
};

const std::error_category& reversion_category() noexcept;
const std::error_category& controller_category() noexcept;

std::error_code make_error_code( reversion_errc e );
std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mona::controller

template<>
struct std::is_error_code_enum< mona::controller::reversion_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< mona::controller::controller_errc >: public std::true_type
{};
