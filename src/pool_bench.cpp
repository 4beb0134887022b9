/*
 * pool_bench.cpp
 *
 * Compact benchmarks for lfpool::pool.
 *
 * Goals:
 *  - QtCore-only (no QtTest/testlib).
 *  - Compact console output.
 *  - get()/release round trips, single thread and 1/2/4/8 threads sharing one pool.
 *  - Baselines: plain new/delete and a mutex-guarded vector free list.
 */

#include <QDebug>
#include <QString>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "pool_bench.h"
#include "pool.hpp"

namespace {

// ------------------------------ knobs ------------------------------

static constexpr std::size_t kPayloadBytes = 256u;
static constexpr unsigned kThreadSteps[] = {1u, 2u, 4u, 8u};

#if defined(NDEBUG)
static constexpr int kOpsST = 4'000'000;
static constexpr int kOpsMT = 1'000'000;
#else
static constexpr int kOpsST = 400'000;
static constexpr int kOpsMT = 100'000;
#endif

// A global sink prevents the optimizer from "being helpful".
static volatile std::uint64_t g_sink = 0u;

struct payload final {
    std::vector<std::uint8_t> bytes;

    payload() : bytes(kPayloadBytes, std::uint8_t{0}) {}
};

struct cell final {
    bool ok = false;
    double v = 0.0; // M ops/s
};

struct row final {
    std::string label;
    cell st{};
    cell mt[std::size(kThreadSteps)]{};
};

struct scoped_timer final {
    using clock = std::chrono::steady_clock;
    clock::time_point t0{clock::now()};

    std::uint64_t elapsed_ns() const noexcept {
        const auto dt = clock::now() - t0;
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(dt).count());
    }
};

static double to_m_per_s(std::uint64_t elapsed_ns, std::uint64_t items) noexcept {
    if (elapsed_ns == 0u || items == 0u) return 0.0;
    const double sec = static_cast<double>(elapsed_ns) * 1e-9;
    return (static_cast<double>(items) / sec) * 1e-6;
}

// ------------------------------ sources ------------------------------

// Each source hands out a payload and takes it back: acquire() / release().

struct lfpool_source final {
    ::lfpool::pool<payload> p;

    auto acquire() { return p.get(); }
    static payload& ref(::lfpool::pool<payload>::guard& g) { return *g; }
    static void release(::lfpool::pool<payload>::guard& g) { g.reset(); }
};

struct heap_source final {
    std::unique_ptr<payload> acquire() { return std::make_unique<payload>(); }
    static payload& ref(std::unique_ptr<payload>& h) { return *h; }
    static void release(std::unique_ptr<payload>& h) { h.reset(); }
};

struct mutex_source final {
    std::mutex m;
    std::vector<payload*> spare;

    ~mutex_source() {
        for (payload* x : spare) delete x;
    }

    struct handle final {
        mutex_source* src = nullptr;
        payload* x = nullptr;

        handle(mutex_source* s, payload* p) noexcept : src(s), x(p) {}
        handle(handle&& o) noexcept : src(o.src), x(o.x) { o.x = nullptr; }
        handle(const handle&) = delete;
        handle& operator=(const handle&) = delete;
        handle& operator=(handle&&) = delete;
        ~handle() { reset(); }

        void reset() {
            if (!x) return;
            std::lock_guard<std::mutex> lk(src->m);
            src->spare.push_back(x);
            x = nullptr;
        }
    };

    handle acquire() {
        {
            std::lock_guard<std::mutex> lk(m);
            if (!spare.empty()) {
                payload* x = spare.back();
                spare.pop_back();
                return handle(this, x);
            }
        }
        return handle(this, new payload());
    }
    static payload& ref(handle& h) { return *h.x; }
    static void release(handle& h) { h.reset(); }
};

// ------------------------------ benches ------------------------------

template <class S>
static std::uint64_t round_trips(S& src, int ops) {
    std::uint64_t local = 0u;
    for (int i = 0; i < ops; ++i) {
        auto h = src.acquire();
        payload& x = S::ref(h);
        x.bytes[static_cast<std::size_t>(i) % kPayloadBytes] ^= static_cast<std::uint8_t>(i);
        local += x.bytes[0];
        S::release(h);
    }
    return local;
}

template <class S>
static cell bench_st(S& src) {
    cell out{};

    // Warm: one payload exists before timing.
    g_sink ^= round_trips(src, 1);

    scoped_timer tm;
    g_sink ^= round_trips(src, kOpsST);

    out.ok = true;
    out.v = to_m_per_s(tm.elapsed_ns(), static_cast<std::uint64_t>(kOpsST));
    return out;
}

template <class S>
static cell bench_mt(S& src, unsigned threads) {
    cell out{};

    std::atomic<unsigned> ready{0u};
    std::atomic<bool> go{false};
    std::atomic<std::uint64_t> sink{0u};

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (unsigned t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            ready.fetch_add(1u, std::memory_order_relaxed);
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            sink.fetch_xor(round_trips(src, kOpsMT), std::memory_order_relaxed);
        });
    }

    while (ready.load(std::memory_order_relaxed) != threads) {
        std::this_thread::yield();
    }

    scoped_timer tm;
    go.store(true, std::memory_order_release);
    for (auto& w : workers) w.join();
    const std::uint64_t ns = tm.elapsed_ns();

    g_sink ^= sink.load();

    out.ok = true;
    out.v = to_m_per_s(ns, static_cast<std::uint64_t>(kOpsMT) * threads);
    return out;
}

// ------------------------------ formatting ------------------------------

static std::string fmt_cell(const cell& c, int width = 8) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << std::setw(width);
    if (!c.ok) {
        oss << "-";
    } else {
        oss << std::setprecision(3) << c.v;
    }
    return oss.str();
}

static void emit_header() {
    qInfo().noquote() << "\n=== lfpool::pool bench (compact) ===";

    {
        std::ostringstream oss;
        oss << "payload_bytes=" << kPayloadBytes
            << " ops_st=" << kOpsST
            << " ops_mt_per_thread=" << kOpsMT
            << " hw_threads=" << std::thread::hardware_concurrency();
        qInfo().noquote() << QString::fromStdString(oss.str());
    }

    std::ostringstream oss;
    oss << "\nFORMAT: source     | st M/s  ";
    for (unsigned t : kThreadSteps) {
        oss << " | mt" << t << " M/s";
    }
    qInfo().noquote() << QString::fromStdString(oss.str());
}

static void emit_row(const row& r) {
    std::ostringstream oss;
    oss << std::left << std::setw(10) << r.label << " | " << fmt_cell(r.st);
    for (const cell& c : r.mt) {
        oss << " | " << fmt_cell(c);
    }
    qInfo().noquote() << QString::fromStdString(oss.str());
}

template <class S>
static void run_suite(row& r, S& src) {
    r.st = bench_st(src);
    for (std::size_t i = 0; i < std::size(kThreadSteps); ++i) {
        r.mt[i] = bench_mt(src, kThreadSteps[i]);
    }
}

} // namespace

int run_pool_bench() {
    emit_header();

    {
        lfpool_source src;
        row r{};
        r.label = "lfpool";
        run_suite(r, src);
        emit_row(r);

        reg nodes = 0u;
        if (!src.p.check_free_list(&nodes)) {
            qWarning().noquote() << "[pool_bench] free list check failed after run";
            return 1;
        }
        qDebug().noquote() << "[pool_bench] lfpool nodes after run:" << nodes;
    }

    {
        heap_source src;
        row r{};
        r.label = "new/delete";
        run_suite(r, src);
        emit_row(r);
    }

    {
        mutex_source src;
        row r{};
        r.label = "mutex+vec";
        run_suite(r, src);
        emit_row(r);
    }

    // Touch the sink to keep the compiler honest.
    if (g_sink == 0xFFFFFFFFFFFFFFFFull) {
        qWarning().noquote() << "[pool_bench] sink hit the impossible";
    }

    return 0;
}
