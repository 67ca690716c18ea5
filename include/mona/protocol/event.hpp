#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <mona/protocol/account.hpp>

namespace mona::protocol {

struct event
{
  std::uint32_t sequence = 0;
  account source{};
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;
};

} // namespace mona::protocol
