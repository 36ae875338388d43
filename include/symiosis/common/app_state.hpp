#pragma once

#include <atomic>

namespace symiosis {
namespace common {

// Process-wide startup state. Written once by Config::load, read by the accessors.
class AppState {
public:
    static AppState& instance();

    AppState() = default;
    AppState(const AppState&) = delete;
    AppState& operator=(const AppState&) = delete;

    void setWasFirstRun(bool first_run) { was_first_run_.store(first_run); }
    bool wasFirstRun() const { return was_first_run_.load(); }

private:
    std::atomic<bool> was_first_run_{false};
};

}}
