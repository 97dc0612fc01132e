#pragma once

#include "opgraph/compiler/Plan.hpp"
#include "opgraph/memory/container/dynamic_bitset.hpp"
#include "opgraph/memory/container/string.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/network/Network.hpp"

namespace opgraph {

// Prunes the network to the operations required to compute outputs from
// inputs and orders them.
//
// Throws:
// - UnsatisfiableOutputError if an output can not be computed.
// - CyclicGraphError if the selected operations are not acyclic.
Plan compile(const Network &network,
             const memory::vector<memory::string> &inputs,
             const memory::vector<memory::string> &outputs);

// Plan of every operation runnable from inputs. Its provided outputs are
// all names produced by those operations.
Plan compile_all(const Network &network,
                 const memory::vector<memory::string> &inputs);

namespace details::compiler {

// Declaration-order topological sort of the selected operations.
// Throws CyclicGraphError if they contain a cycle.
memory::vector<memory::EdgeId>
order_steps(const Network::Graph &graph,
            const memory::dynamic_bitset &selected);

} // namespace details::compiler

} // namespace opgraph
