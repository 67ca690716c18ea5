#include <mona/controller/state.hpp>

#include <utility>

namespace mona::controller::state {
namespace space {

enum class system_space_id : std::uint8_t
{
  program_data = 0
};

const state_db::object_space& program_data()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::program_data ) };
  return s;
}

} // namespace space
} // namespace mona::controller::state
