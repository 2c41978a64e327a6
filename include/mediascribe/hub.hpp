/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mediascribe/job.hpp"

namespace mediascribe {

// A live listener for job updates. deliver() returning false (or throwing)
// means the observer is gone and it will be unregistered. deliver() must not
// call back into Hub::remove() for itself.
class Observer {
public:
    virtual ~Observer() = default;

    virtual bool deliver(const JobSnapshot& snapshot) = 0;
    [[nodiscard]] virtual std::string describe() const { return "observer"; }
};

using ObserverId = std::uint64_t;

class Hub final {
public:
    Hub() = default;

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;
    Hub(Hub&&) = delete;
    Hub& operator=(Hub&&) = delete;

    ObserverId add(std::shared_ptr<Observer> observer);

    // Idempotent. Once it returns the observer receives no further
    // deliveries, even from a publish already in progress.
    bool remove(ObserverId id) noexcept;

    // Delivers to every registered observer and returns the number of
    // successful deliveries. Never throws.
    std::size_t publish(const JobSnapshot& snapshot) noexcept;

    // Delivers only to one observer; used to replay state to a new client.
    bool deliverTo(ObserverId id, const JobSnapshot& snapshot) noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    struct Entry {
        ObserverId id = 0;
        std::shared_ptr<Observer> observer;
        std::mutex deliveryMutex;
        bool active = true;
    };

    enum class Delivery { Delivered, Skipped, Failed };

    Delivery deliverEntry(Entry& entry, const JobSnapshot& snapshot) noexcept;

    mutable std::mutex mutex_;
    std::unordered_map<ObserverId, std::shared_ptr<Entry>> entries_;
    std::atomic<ObserverId> nextId_{1};
};

}
