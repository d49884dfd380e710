#include "alcove/utilities/thread_task_executor.hpp"
#include <exception>

namespace alcove::utilities {

    std::unique_ptr<interfaces::ITaskHandle> ThreadTaskExecutor::Spawn(
        std::function<void(std::stop_token)> task) {
        return std::make_unique<ThreadTaskHandle>(std::move(task));
    }

    ThreadTaskHandle::ThreadTaskHandle(std::function<void(std::stop_token)> task)
        : outcome_(std::make_shared<Outcome>()) {
        thread_ = std::jthread([outcome = outcome_, task = std::move(task)](std::stop_token stop) {
            try {
                task(stop);
            } catch (const std::exception& ex) {
                std::lock_guard guard(outcome->lock);
                outcome->failure = ex.what();
            }
            outcome->finished.store(true, std::memory_order_release);
        });
    }

    ThreadTaskHandle::~ThreadTaskHandle() {
        Abort();
    }

    Result<Unit, std::string> ThreadTaskHandle::Join() {
        if (thread_.joinable()) {
            thread_.join();
        }
        std::lock_guard guard(outcome_->lock);
        if (outcome_->failure.has_value()) {
            return Result<Unit, std::string>::Err(*outcome_->failure);
        }
        return Result<Unit, std::string>::Ok(unit);
    }

    void ThreadTaskHandle::Abort() {
        if (thread_.joinable()) {
            thread_.request_stop();
            thread_.join();
        }
    }

    bool ThreadTaskHandle::IsFinished() const {
        return outcome_->finished.load(std::memory_order_acquire);
    }

}
