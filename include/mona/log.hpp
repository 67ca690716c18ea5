#pragma once

#include <mona/log/log.hpp>
