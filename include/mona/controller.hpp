#pragma once

#include <mona/controller/controller.hpp>
#include <mona/controller/error.hpp>
#include <mona/controller/state.hpp>
