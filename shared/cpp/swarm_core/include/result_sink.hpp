#pragma once
#include "task.hpp"
#include <functional>
#include <string>
#include <utility>

// Receives each succeeded task's accepted answer once. Fire-and-forget: the
// orchestrator logs exceptions thrown from accept() and carries on.
class ResultSink {
public:
    virtual ~ResultSink() = default;
    virtual void accept(const std::string& task_id, const AgentAnswer& result) = 0;
};

class CallbackResultSink : public ResultSink {
public:
    using Callback = std::function<void(const std::string&, const AgentAnswer&)>;
    explicit CallbackResultSink(Callback cb) : cb_(std::move(cb)) {}
    void accept(const std::string& task_id, const AgentAnswer& result) override {
        if (cb_) cb_(task_id, result);
    }

private:
    Callback cb_;
};
