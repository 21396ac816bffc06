#pragma once

#include <QTimer>

#include <functional>

namespace causa {

// Runs a scan repeatedly on the event loop. The next scan is armed only after the
// previous one returns, so scans never overlap even when a scan spins nested
// event loops or outlasts the interval.
class ScanScheduler {
public:
    using ScanFunction = std::function<void()>;

    ScanScheduler(ScanFunction scan, int intervalMs, int firstDelayMs);

    void start();
    void stop();

    [[nodiscard]] bool isScanning() const { return scanning_; }
    [[nodiscard]] int completedScans() const { return completed_; }
    [[nodiscard]] int skippedTicks() const { return skipped_; }

private:
    void fire();

    ScanFunction scan_;
    int intervalMs_;
    int firstDelayMs_;
    QTimer timer_;
    bool running_ = false;
    bool scanning_ = false;
    int completed_ = 0;
    int skipped_ = 0;
};

}  // namespace causa
