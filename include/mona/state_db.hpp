#pragma once

#include <mona/state_db/database.hpp>
#include <mona/state_db/error.hpp>
#include <mona/state_db/object_store.hpp>
#include <mona/state_db/state_delta.hpp>
#include <mona/state_db/state_node.hpp>
#include <mona/state_db/types.hpp>
