/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for floppyforge tests
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "fixtures/MemoryBlockDevice.hpp"
#include "models/TransferTypes.hpp"

/**
 * @brief Unique scratch directory, removed with everything in it
 */
class TempDirectory {
public:
    TempDirectory() {
        std::random_device rd;
        auto base = std::filesystem::temp_directory_path();
        do {
            path_ = base / ("floppyforge-test-" + std::to_string(rd()));
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path WriteFile(const std::string& name, const std::vector<uint8_t>& data) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        return file;
    }

    std::filesystem::path WriteText(const std::string& name, const std::string& text) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::trunc);
        out << text;
        return file;
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief Fixture that records every event a job emits
 *
 * The callback may be invoked from a worker thread.
 */
class EventCaptureFixture : public ::testing::Test {
protected:
    std::mutex events_mutex;
    std::vector<TransferEvent> captured_events;

    EventCallback CreateCapturingCallback() {
        return [this](const TransferEvent& event) {
            std::lock_guard lock(events_mutex);
            captured_events.push_back(event);
        };
    }

    template<typename T>
    std::vector<T> EventsOfType() {
        std::lock_guard lock(events_mutex);
        std::vector<T> result;
        for (const auto& event : captured_events) {
            if (const auto* typed = std::get_if<T>(&event)) {
                result.push_back(*typed);
            }
        }
        return result;
    }

    template<typename T>
    size_t CountOf() {
        return EventsOfType<T>().size();
    }

    std::vector<LogLineEvent> LogLinesWith(LogSeverity severity) {
        auto lines = EventsOfType<LogLineEvent>();
        std::erase_if(lines, [severity](const LogLineEvent& line) { return line.severity != severity; });
        return lines;
    }

    void SetUp() override {
        std::lock_guard lock(events_mutex);
        captured_events.clear();
    }
};

/**
 * @brief Helper for testing threaded operations with timeouts
 */
class ThreadingTestHelper {
public:
    template<typename Callable>
    static bool WaitFor(Callable&& callable,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) {
        auto future = std::async(std::launch::async, std::forward<Callable>(callable));
        return future.wait_for(timeout) == std::future_status::ready;
    }

    template<typename Predicate>
    static bool WaitUntil(Predicate&& predicate,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
                          std::chrono::milliseconds poll_interval = std::chrono::milliseconds{10}) {
        auto start = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - start < timeout) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(poll_interval);
        }
        return false;
    }
};

/**
 * @brief One-shot gate a worker thread blocks on until the test opens it
 */
class WriteGate {
public:
    void Wait() {
        std::unique_lock lock(mutex_);
        ++waiters_;
        cv_.wait(lock, [this] { return open_; });
    }

    void Open() {
        {
            std::lock_guard lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    int Waiters() {
        std::lock_guard lock(mutex_);
        return waiters_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    int waiters_ = 0;
};

inline bool IsAllBytes(const std::vector<uint8_t>& data, size_t begin, size_t end, uint8_t value) {
    return std::all_of(data.begin() + static_cast<std::ptrdiff_t>(begin),
                       data.begin() + static_cast<std::ptrdiff_t>(end),
                       [value](uint8_t b) { return b == value; });
}
