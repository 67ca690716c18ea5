#pragma once

#include <mona/state_db.hpp>

namespace mona::controller { namespace state {

namespace space {

/**
 * Maps a program address to the kind of native program deployed there.
 */
const state_db::object_space& program_data();

} // namespace space

}} // namespace mona::controller::state
