#pragma once

#include <mona/encode/error.hpp>
#include <mona/encode/hex.hpp>
