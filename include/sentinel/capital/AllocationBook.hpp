#pragma once

#include <map>
#include <string>
#include <vector>

#include "sentinel/capital/AllocationTypes.hpp"

namespace sentinel::capital {

// Everything the allocator persists.
struct AllocationState {
    std::vector<Allocation> allocations;
    std::map<std::string, RebalanceResult> buckets;   // hour bucket -> result
    std::map<std::string, RebalanceResult> tokens;    // rebalance token -> result
    uint64_t next_seq = 1;
    bool frozen = false;
    std::string freeze_reason;
};

json::object toJson(const AllocationState& s);
AllocationState stateFromJson(const json::object& o);

// ============================================================
// AllocationBook
//
// JSON state file rewritten atomically (temp + rename). An empty
// path keeps state in memory only. Throws StoreError on I/O or
// parse failure.
// ============================================================
class AllocationBook {
public:
    explicit AllocationBook(std::string path);

    AllocationState load() const;
    void save(const AllocationState& state) const;

    const std::string& path() const { return file; }
    std::string lockPath() const { return file + ".lock"; }

private:
    std::string file;
};

// Cross-process batch lock: a lock file holding the owner's start
// time. A lock older than stale_ms is taken over. A lock whose stamp
// cannot be read is aged by the file's mtime instead.
class BatchLock {
public:
    BatchLock(
        std::string path,
        int64_t stale_ms,
        TimestampMs now
    );
    ~BatchLock();

    BatchLock(const BatchLock&) = delete;
    BatchLock& operator=(const BatchLock&) = delete;

    bool held() const { return owned; }
    const std::string& holderInfo() const { return holder; }

private:
    bool tryCreate(TimestampMs now);

    std::string file;
    bool owned = false;
    std::string holder;
};

}
