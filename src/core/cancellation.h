#pragma once
#include <atomic>

// Cooperative cancellation flag shared between the caller and a running
// discovery pipeline. Raising it stops new probes from being issued and
// ends the browser stage at the next checkpoint.

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};
