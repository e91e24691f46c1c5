#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Running latency summary (Welford), microseconds
struct LatencyStats {
    uint64_t n = 0;
    double mean = 0.0;
    double m2 = 0.0;
    uint64_t lo = UINT64_MAX;
    uint64_t hi = 0;

    void add(uint64_t us) {
        n++;
        lo = std::min(lo, us);
        hi = std::max(hi, us);

        const double delta = (double)us - mean;
        mean += delta / (double)n;
        m2 += delta * ((double)us - mean);
    }

    double stddev() const { return n > 1 ? std::sqrt(m2 / (double)(n - 1)) : 0.0; }
};

// Ledger operations are keyed by outcome as well, so rejected callbacks do
// not skew the latency of applied ones.
struct MetricKey {
    std::string component;
    std::string op;
    std::string outcome;

    bool operator==(const MetricKey& o) const {
        return component == o.component && op == o.op && outcome == o.outcome;
    }
};

struct MetricKeyHash {
    size_t operator()(const MetricKey& k) const noexcept {
        std::hash<std::string> h;
        return h(k.component) ^ (h(k.op) << 1) ^ (h(k.outcome) << 2);
    }
};

// Aggregates per (component, op, outcome) in memory; flush() appends one row
// per key and starts over.
class StatsCsvSink {
public:
    explicit StatsCsvSink(std::string path) : path_(std::move(path)) {}
    ~StatsCsvSink() noexcept {
        try {
            flush();
        } catch (const std::exception& e) {
            std::cerr << "metrics: dropped unflushed stats for " << path_ << ": " << e.what()
                      << std::endl;
        }
    }

    void add(const std::string& component, const std::string& op,
             const std::string& outcome, uint64_t duration_us) {
        std::lock_guard<std::mutex> lk(mu_);
        stats_[MetricKey{component, op, outcome}].add(duration_us);
    }

    uint64_t count(const std::string& component, const std::string& op,
                   const std::string& outcome) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = stats_.find(MetricKey{component, op, outcome});
        return it == stats_.end() ? 0 : it->second.n;
    }

    void flush() {
        std::lock_guard<std::mutex> lk(mu_);
        if (stats_.empty()) return;

        std::ifstream existing(path_, std::ios::binary);
        const bool fresh = !existing.good() || existing.peek() == std::ifstream::traits_type::eof();
        existing.close();

        std::ofstream out(path_, std::ios::app);
        if (!out) return;
        if (fresh) out << "component,op,outcome,count,mean_us,stddev_us,min_us,max_us\n";

        for (const auto& kv : stats_) {
            const LatencyStats& s = kv.second;
            out << kv.first.component << "," << kv.first.op << "," << kv.first.outcome << ","
                << s.n << "," << s.mean << "," << s.stddev() << ","
                << (s.n ? s.lo : 0) << "," << s.hi << "\n";
        }
        stats_.clear();
    }

private:
    std::string path_;
    mutable std::mutex mu_;
    std::unordered_map<MetricKey, LatencyStats, MetricKeyHash> stats_;
};

// Records "ok" unless fail() was called before the scope ends.
class StatsScopeTimer {
public:
    using Clock = std::chrono::steady_clock;

    StatsScopeTimer(StatsCsvSink& sink, std::string component, std::string op)
        : sink_(sink), component_(std::move(component)), op_(std::move(op)),
          outcome_("ok"), start_(Clock::now()) {}

    ~StatsScopeTimer() {
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start_);
        sink_.add(component_, op_, outcome_, (uint64_t)us.count());
    }

    void fail(std::string outcome) { outcome_ = std::move(outcome); }

private:
    StatsCsvSink& sink_;
    std::string component_;
    std::string op_;
    std::string outcome_;
    Clock::time_point start_;
};
