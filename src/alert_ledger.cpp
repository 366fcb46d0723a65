#include "alert_ledger.h"

#include <algorithm>
#include <iterator>

AlertLedger::AlertLedger(size_t capacity)
    : maxRecords(capacity > 0 ? capacity : kDefaultCapacity) {
}

void AlertLedger::append(const AlertRecord& record) {
    std::lock_guard<std::mutex> lock(ledgerMutex);

    // A trigger whose screenshot took longer than a later trigger's can
    // arrive out of order; place it by acceptance time.
    auto position = records.end();
    while (position != records.begin() && std::prev(position)->acceptedAt > record.acceptedAt) {
        --position;
    }
    records.insert(position, record);

    while (records.size() > maxRecords) {
        records.pop_front();
    }
}

std::vector<AlertRecord> AlertLedger::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(ledgerMutex);
    size_t n = std::min(count, records.size());
    return std::vector<AlertRecord>(records.end() - static_cast<std::ptrdiff_t>(n), records.end());
}

void AlertLedger::clear() {
    std::lock_guard<std::mutex> lock(ledgerMutex);
    records.clear();
}

size_t AlertLedger::size() const {
    std::lock_guard<std::mutex> lock(ledgerMutex);
    return records.size();
}
