#include "symiosis/focus/focus_tracker.hpp"
#include "symiosis/common/constants.hpp"

namespace symiosis {
namespace focus {

using common::Logger;

FocusTracker& FocusTracker::instance() {
    static FocusTracker instance;
    return instance;
}

FocusTracker::FocusTracker(common::EventSink sink) : sink_(std::move(sink)) {}

bool FocusTracker::clearPoison() {
    if (!poisoned_) {
        return false;
    }
    poisoned_ = false;
    return true;
}

void FocusTracker::reportRecovery() {
    if (sink_) {
        sink_(constants::log_categories::MAC_FOCUS, "state lock was poisoned, recovering", std::nullopt);
    }
}

void FocusTracker::recordFrontmost(pid_t frontmost, pid_t own) {
    if (frontmost == own) {
        Logger::instance().debug("[Focus] Frontmost is own process, keeping previous | pid={}", own);
        return;
    }
    update([frontmost](std::optional<pid_t>& previous) { previous = frontmost; });
}

std::optional<pid_t> FocusTracker::takePrevious() {
    std::optional<pid_t> value;
    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recovered = clearPoison();
        value = previous_;
        previous_.reset();
    }
    if (recovered) {
        reportRecovery();
    }
    return value;
}

std::optional<pid_t> FocusTracker::peekPrevious() {
    std::optional<pid_t> value;
    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recovered = clearPoison();
        value = previous_;
    }
    if (recovered) {
        reportRecovery();
    }
    return value;
}

bool FocusTracker::isPoisoned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return poisoned_;
}

void saveCurrentFrontmostApp() {
    Logger::instance().debug("[Focus] Frontmost tracking unsupported on this platform");
}

void restorePreviousApp() {
    auto previous = FocusTracker::instance().takePrevious();
    if (previous) {
        Logger::instance().debug("[Focus] Focus restoration unsupported on this platform | pid={}", *previous);
    } else {
        Logger::instance().debug("[Focus] Focus restoration unsupported on this platform");
    }
}

}}
