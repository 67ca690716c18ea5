#pragma once

#include <mona/program/error.hpp>
#include <mona/program/program.hpp>
#include <mona/program/system_interface.hpp>
#include <mona/program/token.hpp>
