#ifndef ALERT_LEDGER_H
#define ALERT_LEDGER_H

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>
#include "alert_record.h"

/**
 * @brief Bounded, thread-safe history of accepted alerts, oldest first
 *
 * When the capacity is exceeded the oldest records are evicted. Records are
 * kept in acceptance order.
 */
class AlertLedger {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit AlertLedger(size_t capacity = kDefaultCapacity);

    /**
     * @brief Add a record, evicting from the head if the ledger is full
     */
    void append(const AlertRecord& record);

    /**
     * @brief Copy of up to count most recent records, newest last
     */
    std::vector<AlertRecord> recent(size_t count) const;

    void clear();
    size_t size() const;
    size_t capacity() const { return maxRecords; }

private:
    size_t maxRecords;
    std::deque<AlertRecord> records;
    mutable std::mutex ledgerMutex;
};

#endif // ALERT_LEDGER_H
