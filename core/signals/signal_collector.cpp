#include "signals/signal_collector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace hdfm {

void CollectorConfig::validate() const {
    if (max_in_flight < 1)
        throw std::invalid_argument("max_in_flight must be at least 1");
    if (per_item_timeout.count() <= 0)
        throw std::invalid_argument("per_item_timeout must be positive");
}

SignalCollector::SignalCollector(CollectorConfig config)
    : config_(config) {
    config_.validate();
}

namespace {

struct LookupSlot {
    std::optional<ThreatSignal> signal;
    std::string error;
};

} // namespace

CollectionReport SignalCollector::collect(
    const ThreatFeed& feed, const std::vector<std::string>& advisory_ids) const {

    auto start = std::chrono::steady_clock::now();

    std::vector<std::string> ids = advisory_ids;
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    // Each worker claims the next id and writes only its own slot
    std::vector<LookupSlot> slots(ids.size());
    std::atomic<size_t> next{0};
    const auto timeout = config_.per_item_timeout;

    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < ids.size(); i = next.fetch_add(1)) {
            auto t0 = std::chrono::steady_clock::now();
            try {
                ThreatSignal s = feed.lookup(ids[i], timeout);
                auto took = std::chrono::steady_clock::now() - t0;
                if (took > timeout) {
                    slots[i].error = "timed out after " +
                        std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(took).count()) +
                        " ms";
                } else {
                    slots[i].signal = s;
                }
            } catch (const std::exception& e) {
                slots[i].error = e.what();
            } catch (...) {
                slots[i].error = "non-standard exception";
            }
        }
    };

    size_t workers = std::min(static_cast<size_t>(config_.max_in_flight), ids.size());
    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
        for (size_t w = 0; w < workers; w++) pool.emplace_back(worker);
    } catch (const std::system_error& e) {
        // Started workers drain the batch; with none, this thread runs it
        spdlog::warn("feed '{}': started {} of {} workers: {}",
                     feed.name(), pool.size(), workers, e.what());
    }
    if (pool.empty() && !ids.empty()) worker();
    for (auto& t : pool) t.join();

    CollectionReport report;
    for (size_t i = 0; i < ids.size(); i++) {
        if (slots[i].signal) {
            report.signals.emplace(ids[i], *slots[i].signal);
        } else {
            spdlog::warn("feed '{}': lookup for {} failed: {}", feed.name(), ids[i], slots[i].error);
            report.failures.push_back({ids[i], slots[i].error});
        }
    }
    report.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    spdlog::info("feed '{}': collected {} of {} advisories ({} failed) in {:.3f}s",
                 feed.name(), report.signals.size(), ids.size(),
                 report.failures.size(), report.elapsed_seconds);
    return report;
}

} // namespace hdfm
