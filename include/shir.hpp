#pragma once

#include "common/io.hpp"
#include "common/logging.hpp"
#include "ir/enumerations.hpp"
#include "ir/expression.hpp"
#include "ir/program.hpp"
#include "ir/statement.hpp"
#include "ir/type.hpp"
#include "profiles/targets.hpp"
