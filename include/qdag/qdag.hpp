#pragma once

// This is the single entry-point for the qdag library.
// Include this file to get access to all the core functionality.

#include "qdag/error.hpp"
#include "qdag/debug.hpp"
#include "qdag/system.hpp"
#include "qdag/circuit/bit.hpp"
#include "qdag/circuit/param.hpp"
#include "qdag/circuit/standard_gate.hpp"
#include "qdag/circuit/operation.hpp"
#include "qdag/circuit/packed_operation.hpp"
#include "qdag/circuit/circuit_instruction.hpp"
#include "qdag/dag/node_handle.hpp"
#include "qdag/dag/op_node.hpp"
#include "qdag/dag/boundary_node.hpp"
#include "qdag/dag/dag_node.hpp"
#include "qdag/dag/node_snapshot.hpp"
#include "qdag/io/codec.hpp"
