#pragma once
#include "alcove/interfaces/i_task_executor.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace alcove::utilities {

/**
 * @brief ITaskExecutor that gives every task its own std::jthread
 */
class ThreadTaskExecutor final : public interfaces::ITaskExecutor {
public:
    [[nodiscard]] std::unique_ptr<interfaces::ITaskHandle> Spawn(
        std::function<void(std::stop_token)> task) override;
};

class ThreadTaskHandle final : public interfaces::ITaskHandle {
public:
    explicit ThreadTaskHandle(std::function<void(std::stop_token)> task);
    ~ThreadTaskHandle() override;

    ThreadTaskHandle(const ThreadTaskHandle&) = delete;
    ThreadTaskHandle& operator=(const ThreadTaskHandle&) = delete;

    [[nodiscard]] Result<Unit, std::string> Join() override;
    void Abort() override;
    [[nodiscard]] bool IsFinished() const override;

private:
    struct Outcome {
        std::atomic<bool> finished{false};
        std::mutex lock;
        std::optional<std::string> failure;
    };

    std::shared_ptr<Outcome> outcome_;
    std::jthread thread_;
};

}  // namespace alcove::utilities
