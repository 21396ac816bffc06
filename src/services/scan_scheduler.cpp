#include "causa/scan_scheduler.hpp"

#include <exception>
#include <utility>

#include "causa/logging.hpp"
#include "causa/telemetry.hpp"

namespace causa {

ScanScheduler::ScanScheduler(ScanFunction scan, int intervalMs, int firstDelayMs)
    : scan_(std::move(scan)),
      intervalMs_(qMax(1, intervalMs)),
      firstDelayMs_(qMax(0, firstDelayMs)) {
    timer_.setSingleShot(true);
    QObject::connect(&timer_, &QTimer::timeout, &timer_, [this]() { fire(); });
}

void ScanScheduler::start() {
    running_ = true;
    timer_.start(firstDelayMs_);
}

void ScanScheduler::stop() {
    running_ = false;
    timer_.stop();
}

void ScanScheduler::fire() {
    if (scanning_) {
        skipped_++;
        qCWarning(lcScanner) << "Previous scan still running, skipping this tick";
        return;
    }

    scanning_ = true;
    try {
        scan_();
    } catch (const std::exception& e) {
        qCWarning(lcScanner) << "Scheduled scan failed:" << e.what();
        Telemetry::instance().incrementCounter("scanner.scheduled_failures");
    }
    scanning_ = false;
    completed_++;

    if (running_) {
        timer_.start(intervalMs_);
    }
}

}  // namespace causa
