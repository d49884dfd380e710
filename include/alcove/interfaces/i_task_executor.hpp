#pragma once
#include "alcove/core/result.hpp"
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
namespace alcove::interfaces {
class ITaskHandle {
public:
    virtual ~ITaskHandle() = default;
    /**
     * Blocks until the task returns. Err carries the message of an exception
     * that escaped the task.
     */
    [[nodiscard]] virtual Result<Unit, std::string> Join() = 0;
    /**
     * Requests a stop through the task's stop_token and waits for it to exit.
     * The task decides how much work it drops.
     */
    virtual void Abort() = 0;
    [[nodiscard]] virtual bool IsFinished() const = 0;
};
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;
    [[nodiscard]] virtual std::unique_ptr<ITaskHandle> Spawn(
        std::function<void(std::stop_token)> task) = 0;
};
}
