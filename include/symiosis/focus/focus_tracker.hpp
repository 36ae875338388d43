#pragma once

#include "../common/logger.hpp"
#include <sys/types.h>
#include <exception>
#include <mutex>
#include <optional>

namespace symiosis {
namespace focus {

// Remembers which process was frontmost before the window was summoned.
class FocusTracker {
public:
    static FocusTracker& instance();

    explicit FocusTracker(common::EventSink sink = common::Logger::instance().getEventSink());
    FocusTracker(const FocusTracker&) = delete;
    FocusTracker& operator=(const FocusTracker&) = delete;

    // Ignores `frontmost` when it is this process, so rapid toggles keep the real target.
    void recordFrontmost(pid_t frontmost, pid_t own);

    std::optional<pid_t> takePrevious();
    std::optional<pid_t> peekPrevious();

    // Runs `fn` on the saved value under the lock. An exception thrown by `fn`
    // poisons the tracker and propagates.
    template<typename Fn>
    void update(Fn&& fn) {
        bool recovered = false;
        std::exception_ptr failure;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            recovered = clearPoison();
            try {
                fn(previous_);
            } catch (...) {
                poisoned_ = true;
                failure = std::current_exception();
            }
        }
        if (recovered) {
            reportRecovery();
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    bool isPoisoned() const;

private:
    mutable std::mutex mutex_;
    std::optional<pid_t> previous_;
    bool poisoned_ = false;
    common::EventSink sink_;

    // Called with mutex_ held. Returns true when a poisoned state was cleared.
    bool clearPoison();
    // Called without mutex_ held, so the sink may use the tracker.
    void reportRecovery();
};

// Platform hooks; only the tracker state is implemented on this platform.
void saveCurrentFrontmostApp();
void restorePreviousApp();

}}
