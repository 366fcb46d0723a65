#include "alert_gate.h"

#include <cmath>
#include <utility>

AlertGate::AlertGate(double cooldownSeconds, ClockFunction clock)
    : cooldown(sanitizeCooldown(cooldownSeconds)),
      clamped(sanitizeCooldown(cooldownSeconds) != cooldownSeconds),
      clock(clock ? std::move(clock) : ClockFunction([] { return Clock::now(); })) {
}

double AlertGate::sanitizeCooldown(double cooldownSeconds) {
    if (!std::isfinite(cooldownSeconds) || cooldownSeconds < 0.0) {
        return kDefaultCooldownSeconds;
    }
    return cooldownSeconds;
}

bool AlertGate::tryAcquire(Clock::time_point* acceptedAt) {
    std::lock_guard<std::mutex> lock(gateMutex);
    Clock::time_point now = clock();
    if (!elapsed(now)) {
        return false;
    }

    lastAlert = now;
    if (acceptedAt) {
        *acceptedAt = now;
    }
    return true;
}

bool AlertGate::canAcquire() const {
    std::lock_guard<std::mutex> lock(gateMutex);
    return elapsed(clock());
}

std::optional<AlertGate::Clock::time_point> AlertGate::lastAlertTime() const {
    std::lock_guard<std::mutex> lock(gateMutex);
    return lastAlert;
}

bool AlertGate::elapsed(Clock::time_point now) const {
    if (!lastAlert) {
        return true;
    }
    return std::chrono::duration<double>(now - *lastAlert) >= cooldown;
}
