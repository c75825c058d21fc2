#pragma once
// Deferred extraction jobs keyed by idempotency key
//
// schedule() registers a job to run at due_at. A key that already ran
// successfully is never scheduled again; scheduling a key that is still
// pending cancels the earlier job and replaces it (the user sent another
// message, so the delay restarts).
//
// The queue owns no thread. The host calls run_due(now) from its own loop;
// jobs run on that thread. A job that throws is retried after a backoff
// that doubles per attempt, and dropped after max_attempts failures.

#include "log.hpp"
#include "types.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace warden {

class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool cancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

using ExtractionJob = std::function<void()>;

constexpr int EXTRACTION_MAX_ATTEMPTS = 3;
constexpr Timestamp EXTRACTION_RETRY_BACKOFF_MS = 60000;

class ExtractionQueue {
public:
    explicit ExtractionQueue(int max_attempts = EXTRACTION_MAX_ATTEMPTS,
                             Timestamp retry_backoff_ms = EXTRACTION_RETRY_BACKOFF_MS)
        : max_attempts_(max_attempts), retry_backoff_ms_(retry_backoff_ms) {}

    // Returns the job's token; a cancelled token if key already completed
    CancellationToken schedule(const std::string& key, Timestamp due_at, ExtractionJob job) {
        std::lock_guard<std::mutex> lock(mutex_);
        CancellationToken token;

        if (completed_.count(key)) {
            log::debug("extract", "Already processed: %s", key.c_str());
            token.cancel();
            return token;
        }

        auto it = pending_.find(key);
        if (it != pending_.end()) {
            it->second.token.cancel();
            log::debug("extract", "Rescheduled: %s", key.c_str());
        }
        pending_[key] = Entry{due_at, std::move(job), token, 0};
        return token;
    }

    // Run every due, non-cancelled job once. Returns the number that succeeded.
    size_t run_due(Timestamp now) {
        std::vector<std::pair<std::string, Entry>> due;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->second.token.cancelled()) {
                    it = pending_.erase(it);
                } else if (it->second.due_at <= now) {
                    due.emplace_back(it->first, std::move(it->second));
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        size_t succeeded = 0;
        for (auto& [key, entry] : due) {
            if (entry.token.cancelled()) continue;
            try {
                entry.job();
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> lock(mutex_);
                ++entry.attempts;
                if (entry.attempts >= max_attempts_) {
                    log::error("extract", "Extraction dropped for %s after %d attempts: %s",
                               key.c_str(), entry.attempts, e.what());
                    continue;
                }
                // Something newer may have replaced it meanwhile
                if (!pending_.count(key) && !completed_.count(key)) {
                    Timestamp backoff = retry_backoff_ms_ << (entry.attempts - 1);
                    log::warn("extract", "Extraction failed for %s (attempt %d), retry in %lld ms: %s",
                              key.c_str(), entry.attempts, static_cast<long long>(backoff), e.what());
                    entry.due_at = now + backoff;
                    pending_[key] = std::move(entry);
                }
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.insert(key);
            auto newer = pending_.find(key);
            if (newer != pending_.end()) {
                newer->second.token.cancel();
                pending_.erase(newer);
            }
            ++succeeded;
            log::info("extract", "Extraction completed: %s", key.c_str());
        }
        return succeeded;
    }

    bool completed(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_.count(key) > 0;
    }

    // Pending and not cancelled
    bool scheduled(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(key);
        return it != pending_.end() && !it->second.token.cancelled();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& [_, entry] : pending_) {
            if (!entry.token.cancelled()) ++n;
        }
        return n;
    }

private:
    struct Entry {
        Timestamp due_at = 0;
        ExtractionJob job;
        CancellationToken token;
        int attempts = 0;
    };

    int max_attempts_;
    Timestamp retry_backoff_ms_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> pending_;
    std::set<std::string> completed_;
};

} // namespace warden
