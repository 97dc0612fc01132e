#pragma once

#include "opgraph/compiler/Plan.hpp"
#include "opgraph/compiler/compile.hpp"
#include "opgraph/diag/errors.hpp"
#include "opgraph/diag/logging.hpp"
#include "opgraph/diag/operation_execution_error.hpp"
#include "opgraph/io/dot.hpp"
#include "opgraph/network/Network.hpp"
#include "opgraph/network/compose.hpp"
#include "opgraph/operation/Operation.hpp"
#include "opgraph/operation/Value.hpp"
#include "opgraph/pipeline/Pipeline.hpp"
#include "opgraph/runtime/Options.hpp"
#include "opgraph/runtime/Solution.hpp"
#include "opgraph/runtime/execute.hpp"
