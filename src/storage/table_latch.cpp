#include "hovel/storage/table_latch.hpp"

#include <algorithm>
#include <utility>

namespace hovel::storage {

void TableLatch::acquire(TableLatchMode mode)
{
    if (mode == TableLatchMode::Exclusive) {
        mutex_.lock();
    } else {
        mutex_.lock_shared();
    }
}

void TableLatch::release(TableLatchMode mode) noexcept
{
    if (mode == TableLatchMode::Exclusive) {
        mutex_.unlock();
    } else {
        mutex_.unlock_shared();
    }
}

std::vector<TableLatchGuard> acquire_in_order(std::vector<OrderedLatch> latches)
{
    std::sort(latches.begin(), latches.end(), [](const OrderedLatch& lhs, const OrderedLatch& rhs) {
        return lhs.key < rhs.key;
    });

    std::vector<OrderedLatch> distinct;
    for (auto& entry : latches) {
        if (!distinct.empty() && distinct.back().key == entry.key) {
            if (entry.mode == TableLatchMode::Exclusive) {
                distinct.back().mode = TableLatchMode::Exclusive;
            }
            continue;
        }
        distinct.push_back(std::move(entry));
    }

    std::vector<TableLatchGuard> guards;
    guards.reserve(distinct.size());
    for (const auto& entry : distinct) {
        guards.emplace_back(*entry.latch, entry.mode);
    }
    return guards;
}

}  // namespace hovel::storage
