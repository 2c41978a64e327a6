/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/hub.hpp"
#include "mediascribe/logger.hpp"

namespace mediascribe {

ObserverId Hub::add(std::shared_ptr<Observer> observer) {
    if (!observer) {
        throw std::invalid_argument("Hub::add called with null observer");
    }

    auto entry = std::make_shared<Entry>();
    entry->id = nextId_.fetch_add(1);
    entry->observer = std::move(observer);

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.emplace(entry->id, entry);
    LOG_DEBUG("Observer registered: " + std::to_string(entry->id) + " (" + entry->observer->describe() +
              "), total " + std::to_string(entries_.size()));
    return entry->id;
}

bool Hub::remove(ObserverId id) noexcept {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        entry = it->second;
        entries_.erase(it);
    }

    // Waits out a delivery in flight; later ones see active == false
    std::lock_guard<std::mutex> lock(entry->deliveryMutex);
    entry->active = false;
    LOG_DEBUG("Observer unregistered: " + std::to_string(id));
    return true;
}

std::size_t Hub::publish(const JobSnapshot& snapshot) noexcept {
    std::vector<std::shared_ptr<Entry>> targets;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(entries_.size());
        for (const auto& kv : entries_) {
            targets.push_back(kv.second);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to collect observers: " + std::string(e.what()));
        return 0;
    }

    std::size_t delivered = 0;
    std::vector<ObserverId> failed;
    for (auto& entry : targets) {
        auto result = deliverEntry(*entry, snapshot);
        if (result == Delivery::Delivered) {
            ++delivered;
        } else if (result == Delivery::Failed) {
            try {
                failed.push_back(entry->id);
            } catch (...) {
                (void)remove(entry->id);
            }
        }
    }

    for (auto id : failed) {
        if (remove(id)) {
            LOG_INFO("Observer " + std::to_string(id) + " dropped after failed delivery");
        }
    }

    LOG_TRACE("Published job " + snapshot.id + " to " + std::to_string(delivered) + " observers");
    return delivered;
}

bool Hub::deliverTo(ObserverId id, const JobSnapshot& snapshot) noexcept {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        entry = it->second;
    }
    auto result = deliverEntry(*entry, snapshot);
    if (result == Delivery::Failed) {
        (void)remove(id);
    }
    return result == Delivery::Delivered;
}

std::size_t Hub::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

Hub::Delivery Hub::deliverEntry(Entry& entry, const JobSnapshot& snapshot) noexcept {
    std::lock_guard<std::mutex> lock(entry.deliveryMutex);
    if (!entry.active) {
        // Removed while this publish was running
        return Delivery::Skipped;
    }
    try {
        return entry.observer->deliver(snapshot) ? Delivery::Delivered : Delivery::Failed;
    } catch (const std::exception& e) {
        LOG_WARN("Observer " + std::to_string(entry.id) + " delivery error: " + std::string(e.what()));
    } catch (...) {
        LOG_WARN("Observer " + std::to_string(entry.id) + " unknown delivery error");
    }
    return Delivery::Failed;
}

}
