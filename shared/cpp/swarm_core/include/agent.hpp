#pragma once
#include "task.hpp"
#include <string>

// A worker that answers a TaskSpec. propose() may be called from
// several threads at once, including concurrently for the same task when the
// agent is repeated in a consensus fan-out.
//
// Throws AgentUnavailable on transport or model errors and AgentTimeout when
// the model does not answer in time.
class Agent {
public:
    virtual ~Agent() = default;
    virtual const std::string& id() const = 0;
    virtual std::string role() const = 0;
    virtual AgentAnswer propose(const TaskSpec& spec) = 0;
};
