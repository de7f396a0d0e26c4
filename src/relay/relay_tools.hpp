#pragma once

#include "common/tool.hpp"
#include "relay/forwarder.hpp"

namespace tools {

// Relay-side version of a worker tool: same name and description, a required
// `project_dir` argument added, and an invoke that forwards to the worker found
// from `project_dir`. The forwarder must outlive the returned tool.
ToolDescriptor make_forwarding_tool(ToolDescriptor worker_tool, Forwarder& forwarder);

// One forwarding tool per entry of tools::catalog().
ToolRegistry make_relay_tools(Forwarder& forwarder);

} // namespace tools
