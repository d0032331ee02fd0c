#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace wrpzmq {

/**
 * Ordered, thread-safe list of callbacks.
 *
 * add() returns a cancel function that removes exactly that registration. The
 * cancel function stays valid after the registry is destroyed. visit() copies
 * the current entries and calls the visitor without holding the lock, so a
 * callback may add or cancel registrations.
 */
template <typename F>
class Subscribers {
public:
    using Cancel = std::function<void()>;

    Cancel add(F f) {
        if (!f) {
            return [] {};
        }
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->entries.emplace(id, std::move(f));
        }
        std::weak_ptr<State> weak = state_;
        return [weak, id]() {
            if (auto state = weak.lock()) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->entries.erase(id);
            }
        };
    }

    template <typename Visitor>
    void visit(Visitor&& visitor) const {
        std::vector<F> snapshot;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            snapshot.reserve(state_->entries.size());
            for (const auto& entry : state_->entries) {
                snapshot.push_back(entry.second);
            }
        }
        for (const auto& f : snapshot) {
            visitor(f);
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->entries.size();
    }

private:
    struct State {
        std::mutex mutex;
        uint64_t next_id = 0;
        std::map<uint64_t, F> entries;
    };

    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace wrpzmq
