/**
 * Alert Manager Tests
 */

#include "alert_manager.h"
#include "test_fakes.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <thread>
#include <vector>

namespace {

std::shared_ptr<Logger> quietLogger() {
    return std::make_shared<Logger>(Logger::Level::Error);
}

}  // namespace

void test_end_to_end_cooldown() {
    std::cout << "\n=== Test: End-to-End Cooldown ===" << std::endl;

    FakeClock clock;
    auto writer = std::make_shared<MemoryScreenshotWriter>();
    auto notifier = std::make_shared<CountingNotifier>();
    AlertManager manager(5.0, writer, notifier, quietLogger(), clock.function());

    cv::Mat frame = makeFrame();

    // t = 0
    auto first = manager.trigger(frame, {"pistol"}, {0.95f});
    assert(first.has_value());
    assert(first->detections.size() == 1);
    assert(first->detections[0].label == "pistol");
    assert(std::fabs(first->detections[0].confidence - 0.95f) < 1e-6f);
    assert(first->screenshotPath.has_value());
    assert(manager.alertCount() == 1);

    // t = 2
    clock.advance(2.0);
    auto second = manager.trigger(frame, {"pistol"}, {0.95f});
    assert(!second.has_value());
    assert(manager.alertCount() == 1);

    // t = 6
    clock.advance(4.0);
    auto third = manager.trigger(frame, {"pistol"}, {0.95f});
    assert(third.has_value());
    assert(manager.alertCount() == 2);

    assert(writer->attempts == 2);
    assert(notifier->plays == 2);

    auto recent = manager.recentAlerts();
    assert(recent.size() == 2);
    assert(recent[0].acceptedAt < recent[1].acceptedAt);
    assert(recent[1].screenshotPath == third->screenshotPath);

    std::cout << "✓ End-to-end cooldown test passed" << std::endl;
}

void test_empty_detections_do_not_consume_cooldown() {
    std::cout << "\n=== Test: Empty Detections ===" << std::endl;

    FakeClock clock;
    auto writer = std::make_shared<MemoryScreenshotWriter>();
    auto notifier = std::make_shared<CountingNotifier>();
    AlertManager manager(5.0, writer, notifier, quietLogger(), clock.function());

    assert(!manager.trigger(makeFrame(), {}, {}).has_value());
    assert(!manager.trigger(makeFrame(), {}, {0.99f}).has_value());
    assert(!manager.trigger(cv::Mat(), {"knife"}, {0.9f}).has_value());

    assert(!manager.gate().lastAlertTime().has_value());
    assert(manager.alertCount() == 0);
    assert(writer->attempts == 0);
    assert(notifier->plays == 0);

    // The gate is still open
    assert(manager.trigger(makeFrame(), {"knife"}, {0.9f}).has_value());

    std::cout << "✓ Empty detections test passed" << std::endl;
}

void test_screenshot_failure_still_records() {
    std::cout << "\n=== Test: Screenshot Failure ===" << std::endl;

    FakeClock clock;
    auto writer = std::make_shared<MemoryScreenshotWriter>();
    writer->failing = true;
    auto notifier = std::make_shared<CountingNotifier>();
    AlertManager manager(5.0, writer, notifier, quietLogger(), clock.function());

    auto record = manager.trigger(makeFrame(), {"pistol"}, {0.91f});
    assert(record.has_value());
    assert(!record->screenshotPath.has_value());
    assert(manager.alertCount() == 1);
    assert(manager.gate().lastAlertTime().has_value());
    assert(notifier->plays == 1);

    // Cooldown was consumed as on success
    clock.advance(1.0);
    assert(!manager.trigger(makeFrame(), {"pistol"}, {0.91f}).has_value());

    std::cout << "✓ Screenshot failure test passed" << std::endl;
}

void test_null_collaborators() {
    std::cout << "\n=== Test: Null Collaborators ===" << std::endl;

    AlertManager manager(5.0, nullptr, nullptr, quietLogger());
    assert(!manager.hasSound());

    auto record = manager.trigger(makeFrame(), {"knife"}, {0.8f});
    assert(record.has_value());
    assert(!record->screenshotPath.has_value());
    assert(manager.alertCount() == 1);

    std::cout << "✓ Null collaborators test passed" << std::endl;
}

void test_detection_score_pairing() {
    std::cout << "\n=== Test: Detection/Score Pairing ===" << std::endl;

    FakeClock clock;
    AlertManager manager(0.0, nullptr, nullptr, quietLogger(), clock.function());

    auto missing = manager.trigger(makeFrame(), {"pistol", "knife"}, {0.7f});
    assert(missing.has_value());
    assert(missing->detections.size() == 2);
    assert(missing->detections[1].label == "knife");
    assert(missing->detections[1].confidence == 0.0f);
    assert(missing->labels() == "pistol, knife");

    auto surplus = manager.trigger(makeFrame(), {"knife"}, {0.6f, 0.9f, 0.8f});
    assert(surplus.has_value());
    assert(surplus->detections.size() == 1);
    assert(std::fabs(surplus->detections[0].confidence - 0.6f) < 1e-6f);

    auto clamped = manager.trigger(makeFrame(), {"pistol", "knife"}, {1.7f, -0.2f});
    assert(clamped.has_value());
    assert(clamped->detections[0].confidence == 1.0f);
    assert(clamped->detections[1].confidence == 0.0f);

    std::cout << "✓ Detection/score pairing test passed" << std::endl;
}

void test_invalid_cooldown_uses_default() {
    std::cout << "\n=== Test: Invalid Cooldown ===" << std::endl;

    AlertManager manager(-3.0, nullptr, nullptr, quietLogger());
    assert(manager.cooldownSeconds() == AlertGate::kDefaultCooldownSeconds);

    std::cout << "✓ Invalid cooldown test passed" << std::endl;
}

void test_concurrent_triggers() {
    std::cout << "\n=== Test: Concurrent Triggers ===" << std::endl;

    FakeClock clock;
    auto writer = std::make_shared<MemoryScreenshotWriter>();
    auto notifier = std::make_shared<CountingNotifier>();
    AlertManager manager(5.0, writer, notifier, quietLogger(), clock.function());

    cv::Mat frame = makeFrame();
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] {
            for (int j = 0; j < 25; j++) {
                if (manager.trigger(frame, {"pistol"}, {0.95f})) {
                    ++accepted;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(accepted == 1);
    assert(manager.alertCount() == 1);
    assert(writer->attempts == 1);
    assert(notifier->plays == 1);

    std::cout << "✓ Concurrent triggers test passed" << std::endl;
}

void test_ledger_bounded_and_clear() {
    std::cout << "\n=== Test: Ledger Bound ===" << std::endl;

    FakeClock clock;
    AlertManager manager(1.0, nullptr, nullptr, quietLogger(), clock.function());

    for (int i = 0; i < 150; i++) {
        assert(manager.trigger(makeFrame(), {"pistol"}, {0.9f}).has_value());
        clock.advance(1.0);
    }
    assert(manager.alertCount() == 100);
    assert(manager.recentAlerts(100).size() == 100);
    assert(manager.recentAlerts().size() == 10);

    manager.clearAlerts();
    assert(manager.alertCount() == 0);

    std::cout << "✓ Ledger bound test passed" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Alert Manager Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_end_to_end_cooldown();
        test_empty_detections_do_not_consume_cooldown();
        test_screenshot_failure_still_records();
        test_null_collaborators();
        test_detection_score_pairing();
        test_invalid_cooldown_uses_default();
        test_concurrent_triggers();
        test_ledger_bounded_and_clear();

        std::cout << "\n========================================" << std::endl;
        std::cout << "  All tests passed! ✓" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
