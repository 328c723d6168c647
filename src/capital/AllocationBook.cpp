#include "sentinel/capital/AllocationBook.hpp"

#include "sentinel/core/Errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace sentinel::capital {

json::object toJson(const AllocationState& s) {
    json::array allocs;
    for (const Allocation& a : s.allocations) {
        allocs.emplace_back(toJson(a));
    }
    json::object buckets;
    for (const auto& [k, v] : s.buckets) {
        buckets[k] = toJson(v);
    }
    json::object tokens;
    for (const auto& [k, v] : s.tokens) {
        tokens[k] = toJson(v);
    }

    json::object o;
    o["version"] = 1;
    o["next_seq"] = s.next_seq;
    o["frozen"] = s.frozen;
    o["freeze_reason"] = s.freeze_reason;
    o["allocations"] = std::move(allocs);
    o["buckets"] = std::move(buckets);
    o["tokens"] = std::move(tokens);
    return o;
}

AllocationState stateFromJson(const json::object& o) {
    AllocationState s;
    s.next_seq = static_cast<uint64_t>(infra::intOr(o, "next_seq", 1));
    s.frozen = infra::boolOr(o, "frozen", false);
    s.freeze_reason = infra::stringOr(o, "freeze_reason", "");

    if (const json::value* v = o.if_contains("allocations")) {
        if (!v->is_array()) {
            throw std::invalid_argument("field 'allocations' must be an array");
        }
        for (const json::value& item : v->get_array()) {
            s.allocations.push_back(
                allocationFromJson(infra::requireObject(item, "allocation"))
            );
        }
    }
    if (const json::object* b = infra::objectAt(o, "buckets")) {
        for (const auto& kv : *b) {
            s.buckets[std::string(kv.key().data(), kv.key().size())] =
                rebalanceResultFromJson(infra::requireObject(kv.value(), "bucket"));
        }
    }
    if (const json::object* t = infra::objectAt(o, "tokens")) {
        for (const auto& kv : *t) {
            s.tokens[std::string(kv.key().data(), kv.key().size())] =
                rebalanceResultFromJson(infra::requireObject(kv.value(), "token"));
        }
    }
    for (const Allocation& a : s.allocations) {
        s.next_seq = std::max(s.next_seq, a.seq + 1);
    }
    return s;
}

// --- AllocationBook ---

AllocationBook::AllocationBook(std::string path)
    : file(std::move(path)) {}

AllocationState AllocationBook::load() const {
    if (file.empty()) {
        return AllocationState();
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        // First run.
        return AllocationState();
    }

    std::stringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw StoreError("cannot read allocation state " + file);
    }
    std::string data = ss.str();
    if (data.empty()) {
        return AllocationState();
    }

    try {
        return stateFromJson(infra::requireObject(json::parse(data), "allocation state"));
    } catch (const std::exception& e) {
        throw StoreError("corrupt allocation state " + file + ": " + e.what());
    }
}

void AllocationBook::save(const AllocationState& state) const {
    if (file.empty()) return;

    std::string tmp = file + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("cannot write " + tmp + ": " + std::strerror(errno));
        }
        out << json::serialize(toJson(state));
        out.flush();
        if (!out) {
            throw StoreError("short write on " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), file.c_str()) != 0) {
        throw StoreError("rename " + tmp + " failed: " + std::strerror(errno));
    }
}

// --- BatchLock ---

BatchLock::BatchLock(
    std::string path,
    int64_t stale_ms,
    TimestampMs now
) : file(std::move(path)) {
    if (tryCreate(now)) return;

    std::optional<TimestampMs> since;
    {
        std::ifstream in(file);
        std::string line;
        if (in && std::getline(in, line)) {
            holder = line;
            try {
                json::value v = json::parse(line);
                if (v.is_object()) {
                    if (const json::value* t = v.get_object().if_contains("since")) {
                        if (t->is_int64()) since = t->get_int64();
                    }
                }
            } catch (const std::exception&) {
                since.reset();
            }
        }
    }

    if (since) {
        if (now - *since < stale_ms) return;
    } else {
        // Owner may not have written its stamp yet: age the file itself.
        struct stat st;
        if (::stat(file.c_str(), &st) != 0) {
            // Released between our open and stat.
            tryCreate(now);
            return;
        }
        TimestampMs mtime = static_cast<TimestampMs>(st.st_mtim.tv_sec) * 1000 +
                            st.st_mtim.tv_nsec / 1000000;
        if (infra::systemClock()() - mtime < stale_ms) {
            if (holder.empty()) holder = "unstamped lock " + file;
            return;
        }
    }

    std::cerr << "[ALLOC] taking over stale lock " << file
              << " (" << holder << ")" << std::endl;
    ::unlink(file.c_str());
    tryCreate(now);
}

BatchLock::~BatchLock() {
    if (owned) {
        ::unlink(file.c_str());
    }
}

bool BatchLock::tryCreate(TimestampMs now) {
    int fd = ::open(file.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        return false;
    }
    json::object o;
    o["pid"] = static_cast<int64_t>(::getpid());
    o["since"] = now;
    std::string body = json::serialize(o) + "\n";
    ssize_t n = ::write(fd, body.data(), body.size());
    ::close(fd);
    if (n != static_cast<ssize_t>(body.size())) {
        ::unlink(file.c_str());
        return false;
    }
    owned = true;
    holder = body;
    return true;
}

}
