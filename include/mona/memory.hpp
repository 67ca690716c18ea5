#pragma once

#include <mona/memory/memory.hpp>
