#pragma once

#include <mona/protocol/account.hpp>
#include <mona/protocol/amount.hpp>
#include <mona/protocol/event.hpp>
#include <mona/protocol/operation.hpp>
#include <mona/protocol/program.hpp>
#include <mona/protocol/transaction.hpp>
