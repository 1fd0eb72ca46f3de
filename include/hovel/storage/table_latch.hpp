#pragma once

#include <shared_mutex>
#include <string>
#include <vector>

namespace hovel::storage {

enum class TableLatchMode {
    Shared,
    Exclusive
};

// Reader/writer latch owned by each cached table handle.
class TableLatch final {
public:
    TableLatch() = default;
    TableLatch(const TableLatch&) = delete;
    TableLatch& operator=(const TableLatch&) = delete;

    void acquire(TableLatchMode mode);
    void release(TableLatchMode mode) noexcept;

private:
    std::shared_mutex mutex_{};
};

class TableLatchGuard final {
public:
    TableLatchGuard(TableLatch& latch, TableLatchMode mode)
        : latch_{&latch}
        , mode_{mode}
    {
        latch_->acquire(mode_);
    }

    TableLatchGuard(const TableLatchGuard&) = delete;
    TableLatchGuard& operator=(const TableLatchGuard&) = delete;

    TableLatchGuard(TableLatchGuard&& other) noexcept
        : latch_{other.latch_}
        , mode_{other.mode_}
    {
        other.latch_ = nullptr;
    }

    TableLatchGuard& operator=(TableLatchGuard&& other) noexcept
    {
        if (this != &other) {
            release();
            latch_ = other.latch_;
            mode_ = other.mode_;
            other.latch_ = nullptr;
        }
        return *this;
    }

    ~TableLatchGuard()
    {
        release();
    }

    [[nodiscard]] TableLatchMode mode() const noexcept
    {
        return mode_;
    }

    void release() noexcept
    {
        if (latch_ != nullptr) {
            latch_->release(mode_);
        }
        latch_ = nullptr;
    }

private:
    TableLatch* latch_ = nullptr;
    TableLatchMode mode_ = TableLatchMode::Shared;
};

// Latches every distinct key once, in ascending key order. Duplicate keys
// collapse into one latch held in the stronger of the requested modes.
struct OrderedLatch final {
    std::string key{};
    TableLatch* latch = nullptr;
    TableLatchMode mode = TableLatchMode::Shared;
};

[[nodiscard]] std::vector<TableLatchGuard> acquire_in_order(std::vector<OrderedLatch> latches);

}  // namespace hovel::storage
