#include <catch2/catch_test_macros.hpp>
#include "alcove/audit/audit_log.hpp"
#include "alcove/crypto/sodium_interop.hpp"
#include "alcove/utilities/thread_task_executor.hpp"
#include "alcove/vault/fixed_secret.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace alcove;
using namespace alcove::audit;
using alcove::configuration::AuditConfig;

namespace {
    std::filesystem::path ScratchDirectory(const std::string& name) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        return std::filesystem::temp_directory_path() / ("alcove-concurrent-" + name + "-" + std::to_string(stamp));
    }

    size_t CountLines(const std::filesystem::path& path) {
        std::ifstream in(path);
        size_t lines = 0;
        for (std::string line; std::getline(in, line);) {
            ++lines;
        }
        return lines;
    }
}

TEST_CASE("Concurrency - Parallel appends reach the file", "[concurrency][audit]") {
    const auto directory = ScratchDirectory("appends");
    auto log = std::make_shared<AuditLog>(AuditConfig(10000, directory.string(), "output.txt"));
    utilities::ThreadTaskExecutor executor;
    log->StartFileFlush(executor);

    constexpr int THREAD_COUNT = 8;
    constexpr int ENTRIES_PER_THREAD = 500;
    std::atomic<size_t> accepted{0};
    std::atomic<size_t> refused{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < ENTRIES_PER_THREAD; ++i) {
                auto logged = log->LogEntry(AuditEntry::Now(
                    AuditConstants::OPERATION_ACCESS, "thread-" + std::to_string(t), static_cast<uint64_t>(i)));
                if (logged.IsOk()) {
                    accepted.fetch_add(1);
                } else {
                    refused.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(accepted.load() + refused.load() == static_cast<size_t>(THREAD_COUNT * ENTRIES_PER_THREAD));
    while (log->Len() > 0) {
        REQUIRE(log->Flush().IsOk());
    }
    REQUIRE(log->StopFileFlush().IsOk());
    REQUIRE(CountLines(directory / "output.txt") == accepted.load());
    std::filesystem::remove_all(directory);
}

TEST_CASE("Concurrency - Containers sharing one log", "[concurrency][audit][vault]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto directory = ScratchDirectory("containers");
    auto log = std::make_shared<AuditLog>(AuditConfig(5000, directory.string(), "output.txt"));
    utilities::ThreadTaskExecutor executor;
    log->StartFileFlush(executor);

    constexpr int SECRET_COUNT = 4;
    constexpr int ACCESSES = 300;
    std::vector<vault::FixedSecret<32>> secrets;
    for (int s = 0; s < SECRET_COUNT; ++s) {
        secrets.push_back(vault::FixedSecret<32>::Random("secret-" + std::to_string(s), log).Unwrap());
    }

    std::atomic<int> failed{0};
    std::vector<std::thread> threads;
    for (int s = 0; s < SECRET_COUNT; ++s) {
        threads.emplace_back([&, s]() {
            for (int i = 0; i < ACCESSES; ++i) {
                if (secrets[static_cast<size_t>(s)].With([](const auto& bytes) { return bytes[0]; }).IsErr()) {
                    failed.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failed.load() == 0);
    for (const auto& secret : secrets) {
        REQUIRE(secret.AccessCount() == static_cast<uint64_t>(ACCESSES));
    }
    while (log->Len() > 0) {
        REQUIRE(log->Flush().IsOk());
    }
    REQUIRE(log->StopFileFlush().IsOk());
    REQUIRE(CountLines(directory / "output.txt") == static_cast<size_t>(SECRET_COUNT * ACCESSES));
    std::filesystem::remove_all(directory);
}
