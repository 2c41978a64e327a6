/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "mediascribe/hub.hpp"
#include "mediascribe/logger.hpp"

using namespace mediascribe;

namespace {

class CountingObserver : public Observer {
public:
    bool deliver(const JobSnapshot&) override {
        if (removed.load()) {
            lateDeliveries.fetch_add(1);
        }
        count.fetch_add(1);
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return accept;
    }

    std::atomic<int> count{0};
    std::atomic<int> lateDeliveries{0};
    std::atomic<bool> removed{false};
    std::chrono::milliseconds delay{0};
    bool accept = true;
};

class ThrowingObserver : public Observer {
public:
    bool deliver(const JobSnapshot&) override {
        throw std::runtime_error("socket gone");
    }
};

JobSnapshot snapshot(const std::string& id, double progress) {
    JobSnapshot s;
    s.id = id;
    s.progress = progress;
    return s;
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);

    std::cout << "[Test] Register, publish, unregister..." << std::endl;
    {
        Hub hub;
        auto a = std::make_shared<CountingObserver>();
        auto b = std::make_shared<CountingObserver>();
        auto idA = hub.add(a);
        auto idB = hub.add(b);
        assert(idA != idB);
        assert(hub.size() == 2);

        assert(hub.publish(snapshot("j", 1.0)) == 2);
        assert(hub.remove(idA));
        assert(!hub.remove(idA));
        assert(hub.size() == 1);

        assert(hub.publish(snapshot("j", 2.0)) == 1);
        assert(a->count.load() == 1);
        assert(b->count.load() == 2);

        assert(hub.deliverTo(idB, snapshot("j", 3.0)));
        assert(!hub.deliverTo(idA, snapshot("j", 3.0)));
        assert(b->count.load() == 3);
    }

    std::cout << "[Test] Register then unregister yields zero deliveries..." << std::endl;
    {
        Hub hub;
        auto o = std::make_shared<CountingObserver>();
        auto id = hub.add(o);
        assert(hub.remove(id));
        assert(!hub.remove(id));
        assert(hub.publish(snapshot("j", 10.0)) == 0);
        assert(o->count.load() == 0);
    }

    std::cout << "[Test] Failing observers are dropped..." << std::endl;
    {
        Hub hub;
        auto ok = std::make_shared<CountingObserver>();
        auto refusing = std::make_shared<CountingObserver>();
        refusing->accept = false;
        hub.add(ok);
        hub.add(refusing);
        hub.add(std::make_shared<ThrowingObserver>());
        assert(hub.size() == 3);

        assert(hub.publish(snapshot("j", 1.0)) == 1);
        assert(hub.size() == 1);
        assert(hub.publish(snapshot("j", 2.0)) == 1);
        assert(refusing->count.load() == 1);
        assert(ok->count.load() == 2);

        bool threw = false;
        try {
            hub.add(nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[Test] No delivery after remove returns, under concurrent publishing..." << std::endl;
    {
        Hub hub;
        std::atomic<bool> stop{false};
        std::vector<std::thread> publishers;
        for (int t = 0; t < 4; ++t) {
            publishers.emplace_back([&hub, &stop, t]() {
                double p = 0.0;
                while (!stop.load()) {
                    hub.publish(snapshot("job-" + std::to_string(t), p));
                    p += 0.01;
                }
            });
        }

        std::vector<std::shared_ptr<CountingObserver>> observers;
        for (int i = 0; i < 50; ++i) {
            auto o = std::make_shared<CountingObserver>();
            o->delay = std::chrono::milliseconds(i % 3);
            auto id = hub.add(o);
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            assert(hub.remove(id));
            o->removed.store(true);
            observers.push_back(o);
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.store(true);
        for (auto& t : publishers) {
            t.join();
        }

        for (const auto& o : observers) {
            assert(o->lateDeliveries.load() == 0);
        }
        assert(hub.size() == 0);
    }

    std::cout << "[Test] Hub tests passed." << std::endl;
    return 0;
}
