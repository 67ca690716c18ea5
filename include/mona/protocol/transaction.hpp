#pragma once

#include <string>
#include <system_error>
#include <vector>

#include <mona/protocol/account.hpp>
#include <mona/protocol/event.hpp>
#include <mona/protocol/operation.hpp>

namespace mona::protocol {

struct transaction
{
  account sender{};
  std::vector< operation > operations;

  bool validate() const noexcept;
};

struct transaction_receipt
{
  bool reverted = false;
  std::error_code error;
  std::vector< event > events;
  std::vector< std::string > logs;
};

} // namespace mona::protocol

template< typename T >
concept Transaction = std::same_as< mona::protocol::transaction, T >;
