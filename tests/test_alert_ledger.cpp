/**
 * Alert Ledger Tests
 */

#include "alert_ledger.h"
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {

AlertRecord makeRecord(int index) {
    AlertRecord record;
    record.acceptedAt = std::chrono::steady_clock::time_point(std::chrono::seconds(index));
    record.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000 + index));
    record.detections.push_back(DetectedObject{"pistol", 0.9f});
    record.screenshotPath = "alerts/alert_" + std::to_string(index) + ".jpg";
    return record;
}

int indexOf(const AlertRecord& record) {
    return static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(
        record.acceptedAt.time_since_epoch()).count());
}

}  // namespace

void test_empty_ledger() {
    std::cout << "\n=== Test: Empty Ledger ===" << std::endl;

    AlertLedger ledger;
    assert(ledger.size() == 0);
    assert(ledger.capacity() == AlertLedger::kDefaultCapacity);
    assert(ledger.recent(10).empty());

    AlertLedger zero(0);
    assert(zero.capacity() == AlertLedger::kDefaultCapacity);

    std::cout << "✓ Empty ledger test passed" << std::endl;
}

void test_recent_returns_newest_last() {
    std::cout << "\n=== Test: Recent Order ===" << std::endl;

    AlertLedger ledger;
    for (int i = 0; i < 5; i++) {
        ledger.append(makeRecord(i));
    }

    auto lastThree = ledger.recent(3);
    assert(lastThree.size() == 3);
    assert(indexOf(lastThree[0]) == 2);
    assert(indexOf(lastThree[1]) == 3);
    assert(indexOf(lastThree[2]) == 4);

    auto all = ledger.recent(50);
    assert(all.size() == 5);
    assert(indexOf(all.front()) == 0);

    std::cout << "✓ Recent order test passed" << std::endl;
}

void test_capacity_eviction() {
    std::cout << "\n=== Test: Capacity Eviction ===" << std::endl;

    AlertLedger ledger;
    for (int i = 0; i < 150; i++) {
        ledger.append(makeRecord(i));
        assert(ledger.size() <= 100);
    }

    assert(ledger.size() == 100);
    auto records = ledger.recent(100);
    assert(records.size() == 100);
    for (size_t i = 0; i < records.size(); i++) {
        assert(indexOf(records[i]) == static_cast<int>(50 + i));
    }

    std::cout << "✓ Capacity eviction test passed" << std::endl;
}

void test_out_of_order_append() {
    std::cout << "\n=== Test: Out Of Order Append ===" << std::endl;

    AlertLedger ledger(10);
    ledger.append(makeRecord(1));
    ledger.append(makeRecord(3));
    ledger.append(makeRecord(2));
    ledger.append(makeRecord(0));

    auto records = ledger.recent(10);
    assert(records.size() == 4);
    for (size_t i = 0; i < records.size(); i++) {
        assert(indexOf(records[i]) == static_cast<int>(i));
    }

    std::cout << "✓ Out of order append test passed" << std::endl;
}

void test_snapshot_is_a_copy() {
    std::cout << "\n=== Test: Snapshot Copy ===" << std::endl;

    AlertLedger ledger;
    ledger.append(makeRecord(7));

    auto snapshot = ledger.recent(1);
    snapshot[0].detections.clear();
    snapshot[0].screenshotPath.reset();

    auto again = ledger.recent(1);
    assert(again[0].detections.size() == 1);
    assert(again[0].screenshotPath.has_value());

    ledger.clear();
    assert(ledger.size() == 0);
    assert(snapshot.size() == 1);

    std::cout << "✓ Snapshot copy test passed" << std::endl;
}

void test_concurrent_append_and_read() {
    std::cout << "\n=== Test: Concurrent Append/Read ===" << std::endl;

    AlertLedger ledger;
    std::atomic<bool> done{false};

    std::thread reader([&] {
        while (!done) {
            auto records = ledger.recent(100);
            assert(records.size() <= 100);
            for (size_t i = 1; i < records.size(); i++) {
                assert(records[i - 1].acceptedAt <= records[i].acceptedAt);
            }
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; w++) {
        writers.emplace_back([&ledger, w] {
            for (int i = 0; i < 100; i++) {
                ledger.append(makeRecord(w * 1000 + i));
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }
    done = true;
    reader.join();

    assert(ledger.size() == 100);

    std::cout << "✓ Concurrent append/read test passed" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Alert Ledger Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_empty_ledger();
        test_recent_returns_newest_last();
        test_capacity_eviction();
        test_out_of_order_append();
        test_snapshot_is_a_copy();
        test_concurrent_append_and_read();

        std::cout << "\n========================================" << std::endl;
        std::cout << "  All tests passed! ✓" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
