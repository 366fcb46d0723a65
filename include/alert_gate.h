#ifndef ALERT_GATE_H
#define ALERT_GATE_H

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

/**
 * @brief Thread-safe cooldown gate deciding whether a new alert may fire
 *
 * Two accepted alerts are never closer together than the cooldown, measured
 * between acceptance instants. Denied callers return immediately.
 */
class AlertGate {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    static constexpr double kDefaultCooldownSeconds = 5.0;

    /**
     * @brief Constructor
     * @param cooldownSeconds Minimum seconds between alerts; negative or
     *        non-finite values fall back to kDefaultCooldownSeconds
     * @param clock Time source, defaults to std::chrono::steady_clock::now
     */
    explicit AlertGate(double cooldownSeconds = kDefaultCooldownSeconds, ClockFunction clock = nullptr);

    /**
     * @brief Atomically check the cooldown and, if it has elapsed, claim it
     * @param acceptedAt Receives the acceptance instant when granted (optional)
     * @return True if the caller may raise an alert now
     */
    bool tryAcquire(Clock::time_point* acceptedAt = nullptr);

    /**
     * @brief Check whether tryAcquire would currently succeed, without claiming
     */
    bool canAcquire() const;

    /**
     * @brief Instant of the most recently accepted alert, empty if none yet
     */
    std::optional<Clock::time_point> lastAlertTime() const;

    double cooldownSeconds() const { return cooldown.count(); }

    /**
     * @brief True when the requested cooldown was rejected and the default used
     */
    bool wasClamped() const { return clamped; }

    /**
     * @brief Return a requested cooldown if it is usable, otherwise the default
     */
    static double sanitizeCooldown(double cooldownSeconds);

private:
    bool elapsed(Clock::time_point now) const;

    std::chrono::duration<double> cooldown;
    bool clamped;
    ClockFunction clock;
    std::optional<Clock::time_point> lastAlert;
    mutable std::mutex gateMutex;
};

#endif // ALERT_GATE_H
