#pragma once
#include <stdexcept>
#include <string>

// Graph construction errors. These are fatal: a run never starts on a bad graph.
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CycleError : public GraphError {
public:
    using GraphError::GraphError;
};

class DuplicateIdError : public GraphError {
public:
    using GraphError::GraphError;
};

class UnknownDependencyError : public GraphError {
public:
    using GraphError::GraphError;
};

// Thrown by Agent::propose. The orchestrator recovers from these by retrying.
class AgentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AgentUnavailable : public AgentError {
public:
    using AgentError::AgentError;
};

class AgentTimeout : public AgentError {
public:
    using AgentError::AgentError;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
