#pragma once

#include <cstddef>
#include <vector>

namespace mona::protocol {

struct program_input
{
  std::vector< std::byte > stdin;
};

struct program_output
{
  std::vector< std::byte > stdout;
};

} // namespace mona::protocol
