#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <unordered_map>
#include <mutex>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <optional>
#include <cstdint>

#ifdef PROF_ENABLED

class Profiler {
public:
    struct Entry {
        std::string name;
        std::uint64_t count = 0;
        long double totalNs = 0;
        long double minNs = 0;
        long double maxNs = 0;

        long double avgNs() const { return totalNs / (count ? count : 1); }
    };

    // Null profiler means the guard records nothing.
    class ScopeGuard {
    public:
        ScopeGuard(Profiler* p, std::string n)
            : prof_(p), name_(p ? std::move(n) : std::string{}),
              t0_(std::chrono::steady_clock::now()) {}
        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;
        ~ScopeGuard() {
            if (!prof_) return;
            auto t1 = std::chrono::steady_clock::now();
            long double ns = std::chrono::duration<long double, std::nano>(t1 - t0_).count();
            prof_->record(name_, ns);
        }
    private:
        Profiler* prof_;
        std::string name_;
        std::chrono::steady_clock::time_point t0_;
    };

    void record(const std::string& n, long double ns) {
        std::lock_guard<std::mutex> lk(m_);
        auto &e = map_[n];
        if (e.count == 0) {
            e.name = n;
            e.minNs = e.maxNs = ns;
        } else {
            e.minNs = std::min(e.minNs, ns);
            e.maxNs = std::max(e.maxNs, ns);
        }
        e.totalNs += ns;
        ++e.count;
    }

    std::optional<Entry> find(const std::string& n) const {
        std::lock_guard<std::mutex> lk(m_);
        auto it = map_.find(n);
        if (it == map_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Entry> summary() const {
        std::lock_guard<std::mutex> lk(m_);
        std::vector<Entry> out;
        out.reserve(map_.size());
        for (auto &kv : map_) out.push_back(kv.second);
        std::sort(out.begin(), out.end(),
                  [](const Entry& a, const Entry& b){ return a.name < b.name; });
        return out;
    }

    void reset() {
        std::lock_guard<std::mutex> lk(m_);
        map_.clear();
    }

    void dump(std::ostream& os) const {
        auto rows = summary();
        if (rows.empty()) return;
        auto toUs = [](long double ns){ return ns / 1000.0L; };
        auto toMs = [](long double ns){ return ns / 1'000'000.0L; };
        os << "\n==== Profiler Summary ====\n";
        os << std::left << std::setw(28) << "Section"
           << std::right << std::setw(10) << "Count"
           << std::setw(12) << "Avg (us)"
           << std::setw(13) << "Total (ms)"
           << std::setw(12) << "Min (us)"
           << std::setw(12) << "Max (us)"
           << "\n";
        for (auto &e : rows) {
            os << std::left << std::setw(28) << e.name
               << std::right << std::setw(10) << e.count
               << std::fixed << std::setprecision(3)
               << std::setw(12) << toUs(e.avgNs())
               << std::setw(13) << toMs(e.totalNs)
               << std::setw(12) << toUs(e.minNs)
               << std::setw(12) << toUs(e.maxNs)
               << "\n";
        }
        os << "==========================\n";
    }

private:
    mutable std::mutex m_;
    std::unordered_map<std::string, Entry> map_;
};

#define PROF_CONCAT_INNER(a,b) a##b
#define PROF_CONCAT(a,b) PROF_CONCAT_INNER(a,b)

// Guard lives until the end of the enclosing block.
#define PROF_SCOPE(PTR, NAME) \
    ::Profiler::ScopeGuard PROF_CONCAT(_prof_guard_, __LINE__){(PTR), (PTR) ? std::string(NAME) : std::string{}}

#else   // PROF_ENABLED not defined

class Profiler {
public:
    struct Entry {
        std::string name; std::uint64_t count=0; long double totalNs=0,minNs=0,maxNs=0;
        long double avgNs() const { return 0; }
    };
    class ScopeGuard { public: ScopeGuard(Profiler*, std::string) {} };
    std::optional<Entry> find(const std::string&) const { return std::nullopt; }
    std::vector<Entry> summary() const { return {}; }
    void reset() {}
    void dump(std::ostream&) const {}
};

#define PROF_SCOPE(PTR, NAME) do{}while(0)

#endif
