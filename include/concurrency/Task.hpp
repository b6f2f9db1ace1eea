#pragma once

#include <functional>
#include <string>
#include <utility>

namespace aax::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Used in worker diagnostics
    [[nodiscard]] virtual std::string name() const { return "task"; }
};

// Wraps a callable so one-off blocking work can go through the pool.
struct FunctionTask final : Task {
    std::string label;
    std::function<void()> fn;

    FunctionTask(std::string label, std::function<void()> fn)
        : label(std::move(label)), fn(std::move(fn)) {}

    void operator()() override { fn(); }

    [[nodiscard]] std::string name() const override { return label; }
};

}
