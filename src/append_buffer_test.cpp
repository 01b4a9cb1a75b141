// append_buffer_test.cpp
// Paranoid API/contract tests for lseq::append_buffer.

#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QProcess>
#include <QProcessEnvironment>

#include <atomic>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#if !defined(LSEQ_ASSERT) && !defined(NDEBUG)
#  define LSEQ_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#endif

#include "append_buffer.hpp"
#include "base/lseq_policy.hpp"

namespace lseq_append_buffer_death_detail {

#if !defined(NDEBUG)

static constexpr int kDeathExitCode = 0xB4;

static void sigabrt_handler_(int) noexcept {
    std::_Exit(kDeathExitCode);
}

[[noreturn]] static void run_case_(const char* mode) {
    std::signal(SIGABRT, &sigabrt_handler_);

    using B = lseq::append_buffer<std::uint32_t>;

    if (std::strcmp(mode, "index_on_empty") == 0) {
        B b;
        (void)b[0u];
    } else if (std::strcmp(mode, "index_past_size") == 0) {
        B b;
        b.push_back(1u);
        (void)b[1u];
    } else {
        std::_Exit(0xEF);
    }

    std::_Exit(0xF0);
}

struct Runner_ {
    Runner_() {
        const char* mode = std::getenv("LSEQ_APPEND_BUFFER_DEATH");
        if (mode && *mode) {
            run_case_(mode);
        }
    }
};

static const Runner_ g_runner_{};

#endif // !defined(NDEBUG)

} // namespace lseq_append_buffer_death_detail

namespace {

struct Blob {
    std::uint32_t seq{};
    std::uint32_t tag{};

    bool operator==(const Blob& o) const noexcept {
        return seq == o.seq && tag == o.tag;
    }
};

template <std::size_t Align>
struct alignas(Align) OverAligned {
    std::uint64_t a{};
    std::uint32_t b{};
};

template <typename Ptr>
static bool is_aligned(Ptr p, std::size_t a) noexcept {
    const auto v = reinterpret_cast<std::uintptr_t>(p);
    return (v % a) == 0u;
}

struct Rng {
    std::mt19937 gen;
    explicit Rng(std::uint32_t seed) : gen(seed) {}

    std::uint32_t u32(std::uint32_t lo, std::uint32_t hi) {
        std::uniform_int_distribution<std::uint32_t> d(lo, hi);
        return d(gen);
    }
};

// Counts live instances; copy or move construction can be told to throw.
struct Tracked {
    static inline int live = 0;
    static inline int throw_on_copy_after = -1;

    std::uint32_t v{};

    explicit Tracked(std::uint32_t x) : v(x) { ++live; }

    Tracked(const Tracked& o) : v(o.v) {
        if (throw_on_copy_after == 0) {
            throw std::runtime_error("copy");
        }
        if (throw_on_copy_after > 0) {
            --throw_on_copy_after;
        }
        ++live;
    }

    // Not noexcept: growth must fall back to copying.
    Tracked(Tracked&& o) : Tracked(static_cast<const Tracked&>(o)) {}

    Tracked& operator=(const Tracked&) = delete;

    ~Tracked() { --live; }
};

// No default constructor: only appended slots may be constructed.
struct NoDefault {
    explicit NoDefault(std::string s) : text(std::move(s)) {}
    std::string text;
};

template <class B>
static void assert_invariants(const B& b) {
    QVERIFY2(b.size() <= b.capacity(), "size() must not exceed capacity()");
    QCOMPARE(b.empty(), b.size() == 0u);
    QVERIFY(b.capacity() <= B::max_size());
}

// Address of the first slot; the buffer must not be empty.
template <class B>
static const void* base_of(const B& b) {
    return &b[0u];
}

static void api_smoke_compile() {
    using B = lseq::append_buffer<Blob>;

    static_assert(!std::is_copy_constructible_v<B>);
    static_assert(!std::is_copy_assignable_v<B>);
    static_assert(!std::is_move_constructible_v<B>);

    static_assert(std::is_same_v<decltype(std::declval<B&>().size()), reg>);
    static_assert(std::is_same_v<decltype(std::declval<B&>().capacity()), reg>);
    static_assert(std::is_same_v<decltype(std::declval<const B&>()[reg{}]), const Blob&>);
    static_assert(std::is_same_v<decltype(std::declval<B&>().emplace_back()), Blob&>);
    static_assert(std::is_same_v<B::allocator_type, lseq::alloc::basic_allocator<Blob>>);

    // Usable as a lazy_sequence cache.
    static_assert(lseq::storage::detail::is_cache_like_v<B, Blob>);
    static_assert(lseq::storage::detail::is_cache_like_v<std::deque<Blob>, Blob>);
    static_assert(!lseq::storage::detail::is_cache_like_v<int, Blob>);
}

static void basic_append_suite() {
    lseq::append_buffer<Blob> b;
    assert_invariants(b);
    QCOMPARE(b.capacity(), reg{0u});

    b.push_back(Blob{1u, 11u});
    assert_invariants(b);
    QCOMPARE(b.size(), reg{1u});
    QCOMPARE(b.capacity(), static_cast<reg>(LSEQ_BUFFER_INITIAL_CAPACITY));

    Blob& ref = b.emplace_back(Blob{2u, 22u});
    QCOMPARE(ref.seq, 2u);
    QCOMPARE(b[0u].seq, 1u);
    QCOMPARE(b[1u].tag, 22u);

    const Blob c{3u, 33u};
    b.push_back(c);
    QCOMPARE(b[2u], c);
    assert_invariants(b);

}

static void growth_sequence_suite() {
    lseq::append_buffer<std::uint32_t> b;
    reg prev_cap = 0u;
    for (std::uint32_t i = 0; i < 10000u; ++i) {
        b.push_back(i);
        QVERIFY(b.capacity() >= b.size());
        QVERIFY(b.capacity() >= prev_cap);
        prev_cap = b.capacity();
    }
    assert_invariants(b);
    for (std::uint32_t i = 0; i < 10000u; ++i) {
        QCOMPARE(b[i], i);
    }

    // +50% growth keeps relocations logarithmic: far fewer than one per append.
    lseq::append_buffer<std::uint32_t> c;
    int relocations = 0;
    const void* last_base = nullptr;
    for (std::uint32_t i = 0; i < 10000u; ++i) {
        c.push_back(i);
        if (base_of(c) != last_base) {
            ++relocations;
            last_base = base_of(c);
        }
    }
    QVERIFY(relocations < 40);
}

static void reserve_suite() {
    lseq::append_buffer<Blob> b;
    b.reserve(100u);
    QCOMPARE(b.capacity(), reg{100u});
    QVERIFY(b.empty());

    const void* base = nullptr;
    for (std::uint32_t i = 0; i < 100u; ++i) {
        b.push_back(Blob{i, i * 3u});
        if (i == 0u) {
            base = base_of(b);
        }
    }
    QVERIFY(base_of(b) == base);
    QCOMPARE(b.capacity(), reg{100u});

    b.reserve(10u);
    QCOMPARE(b.capacity(), reg{100u});

    QVERIFY_THROWS_EXCEPTION(std::bad_alloc, b.reserve(lseq::append_buffer<Blob>::max_size() + 1u));
    QCOMPARE(b.size(), reg{100u});
    QCOMPARE(b[99u].seq, 99u);
}

static void self_alias_append_suite() {
    lseq::append_buffer<std::string> b;
    b.push_back(std::string(64, 'x'));
    while (b.size() < b.capacity()) {
        b.push_back(std::to_string(b.size()));
    }

    // The next append grows and must not read a relocated argument.
    b.push_back(b[0u]);
    QCOMPARE(b[b.size() - 1u], std::string(64, 'x'));
    QCOMPARE(b[0u], std::string(64, 'x'));
}

static void no_default_ctor_suite() {
    lseq::append_buffer<NoDefault> b;
    b.emplace_back(std::string("a"));
    b.emplace_back(std::string("b"));
    QCOMPARE(b.size(), reg{2u});
    QCOMPARE(b[1u].text, std::string("b"));
}

static void strong_guarantee_suite() {
    Tracked::live = 0;
    Tracked::throw_on_copy_after = -1;
    {
        lseq::append_buffer<Tracked> b;
        for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(LSEQ_BUFFER_INITIAL_CAPACITY); ++i) {
            b.emplace_back(i);
        }
        QCOMPARE(Tracked::live, static_cast<int>(LSEQ_BUFFER_INITIAL_CAPACITY));
        const void* before = base_of(b);
        const reg cap = b.capacity();

        // Relocation copies three elements, the fourth copy throws.
        Tracked::throw_on_copy_after = 3;
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, b.emplace_back(999u));
        Tracked::throw_on_copy_after = -1;

        QVERIFY(base_of(b) == before);
        QCOMPARE(b.capacity(), cap);
        QCOMPARE(b.size(), static_cast<reg>(LSEQ_BUFFER_INITIAL_CAPACITY));
        for (reg i = 0; i < b.size(); ++i) {
            QCOMPARE(b[i].v, static_cast<std::uint32_t>(i));
        }
        QCOMPARE(Tracked::live, static_cast<int>(LSEQ_BUFFER_INITIAL_CAPACITY));

        QCOMPARE(b.emplace_back(1000u).v, 1000u);
    }
    QCOMPARE(Tracked::live, 0);
}

static void fuzz_against_vector_suite() {
    Rng rng(0xA11CE5u);
    for (int round = 0; round < 50; ++round) {
        lseq::append_buffer<Blob> b;
        std::vector<Blob> shadow;
        const std::uint32_t n = rng.u32(0u, 600u);
        for (std::uint32_t i = 0; i < n; ++i) {
            const std::uint32_t op = rng.u32(0u, 9u);
            if (op == 0u) {
                b.reserve(static_cast<reg>(b.size() + rng.u32(0u, 64u)));
            } else if (op == 1u && !shadow.empty()) {
                const Blob& alias = b[rng.u32(0u, static_cast<std::uint32_t>(b.size() - 1u))];
                shadow.push_back(alias);
                b.push_back(alias);
            } else {
                const Blob x{i, rng.u32(0u, 0xFFFFu)};
                shadow.push_back(x);
                b.push_back(x);
            }
        }
        assert_invariants(b);
        QCOMPARE(b.size(), static_cast<reg>(shadow.size()));
        for (reg i = 0; i < b.size(); ++i) {
            QCOMPARE(b[i], shadow[static_cast<std::size_t>(i)]);
        }
    }
}

struct CountingAllocatorState {
    static inline std::atomic<std::size_t> alloc_calls{0};
    static inline std::atomic<std::size_t> dealloc_calls{0};
    static inline std::atomic<std::size_t> bytes_live{0};
};

template <typename T>
struct CountingAllocator {
    using value_type = T;
    using is_always_equal = std::true_type;

    template <typename U>
    struct rebind { using other = CountingAllocator<U>; };

    CountingAllocator() noexcept = default;

    template <typename U>
    CountingAllocator(const CountingAllocator<U>&) noexcept {}

    [[nodiscard]] T* allocate(std::size_t n) {
        CountingAllocatorState::alloc_calls.fetch_add(1, std::memory_order_relaxed);
        CountingAllocatorState::bytes_live.fetch_add(n * sizeof(T), std::memory_order_relaxed);
        return std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept {
        CountingAllocatorState::dealloc_calls.fetch_add(1, std::memory_order_relaxed);
        CountingAllocatorState::bytes_live.fetch_sub(n * sizeof(T), std::memory_order_relaxed);
        std::allocator<T>{}.deallocate(p, n);
    }

    template <typename U>
    bool operator==(const CountingAllocator<U>&) const noexcept { return true; }
    template <typename U>
    bool operator!=(const CountingAllocator<U>&) const noexcept { return false; }
};

static void reset_alloc_counters() {
    CountingAllocatorState::alloc_calls.store(0, std::memory_order_relaxed);
    CountingAllocatorState::dealloc_calls.store(0, std::memory_order_relaxed);
    CountingAllocatorState::bytes_live.store(0, std::memory_order_relaxed);
}

static void allocator_accounting_suite() {
    using B = lseq::append_buffer<Blob, CountingAllocator<std::byte>>;

    reset_alloc_counters();

    {
        B b;
        QCOMPARE(CountingAllocatorState::alloc_calls.load(std::memory_order_relaxed), std::size_t{0});

        b.push_back(Blob{1u, 11u});
        QCOMPARE(CountingAllocatorState::alloc_calls.load(std::memory_order_relaxed), std::size_t{1});
        QVERIFY(CountingAllocatorState::bytes_live.load(std::memory_order_relaxed) >= sizeof(Blob));

        for (std::uint32_t i = 0; i < 200u; ++i) {
            b.push_back(Blob{i, i});
        }
        QVERIFY(CountingAllocatorState::alloc_calls.load(std::memory_order_relaxed) > 1u);
        QCOMPARE(CountingAllocatorState::bytes_live.load(std::memory_order_relaxed),
                 static_cast<std::size_t>(b.capacity()) * sizeof(Blob));
        QCOMPARE(b.size(), reg{201u});
    }

    QCOMPARE(CountingAllocatorState::bytes_live.load(std::memory_order_relaxed), std::size_t{0});
    QCOMPARE(CountingAllocatorState::alloc_calls.load(std::memory_order_relaxed),
             CountingAllocatorState::dealloc_calls.load(std::memory_order_relaxed));
}

static void alignment_sweep_suite() {
    {
        lseq::append_buffer<OverAligned<64>> b;
        b.push_back(OverAligned<64>{});
        QVERIFY(is_aligned(base_of(b), alignof(OverAligned<64>)));
    }

    {
        lseq::append_buffer<std::uint32_t, lseq::alloc::align_alloc<128>> b;
        for (std::uint32_t i = 0; i < 100u; ++i) {
            b.push_back(i);
            QVERIFY(is_aligned(base_of(b), 128u));
        }
    }

    {
        lseq::append_buffer<OverAligned<128>, lseq::alloc::align_alloc<16>> b;
        b.push_back(OverAligned<128>{});
        QVERIFY(is_aligned(base_of(b), alignof(OverAligned<128>)));
    }

    {
        lseq::alloc::aligned_allocator<std::uint64_t, 256> a;
        std::uint64_t* p = a.allocate(3u);
        QVERIFY(is_aligned(p, 256u));
        a.deallocate(p, 3u);
    }

    {
        lseq::alloc::basic_allocator<std::uint64_t> a;
        QVERIFY_THROWS_EXCEPTION(std::bad_alloc,
            (void)a.allocate(std::numeric_limits<std::size_t>::max() / 2u));
    }
}

class tst_append_buffer_api_paranoid final : public QObject {
    Q_OBJECT

private slots:
    void api_smoke() {
        api_smoke_compile();
    }

    void basic_append() {
        basic_append_suite();
    }

    void growth_sequence() {
        growth_sequence_suite();
    }

    void reserve_contract() {
        reserve_suite();
    }

    void self_alias_append() {
        self_alias_append_suite();
    }

    void no_default_ctor() {
        no_default_ctor_suite();
    }

    void strong_guarantee() {
        strong_guarantee_suite();
    }

    void fuzz_against_vector() {
        fuzz_against_vector_suite();
    }

    void allocator_accounting() {
        allocator_accounting_suite();
    }

    void alignment_sweep() {
        alignment_sweep_suite();
    }

    void death_tests_debug_only() {
#if !defined(NDEBUG)
        auto expect_death = [&](const char* mode) {
            QProcess p;
            p.setProgram(QCoreApplication::applicationFilePath());
            p.setArguments(QStringList{});

            QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
            env.insert("LSEQ_APPEND_BUFFER_DEATH", QString::fromLatin1(mode));
            p.setProcessEnvironment(env);

            p.start();
            QVERIFY2(p.waitForStarted(1500), "Death child failed to start.");

            if (!p.waitForFinished(8000)) {
                p.kill();
                QVERIFY2(false, "Death child did not finish (possible crash dialog).");
            }

            const int code = p.exitCode();
            QVERIFY2(code == lseq_append_buffer_death_detail::kDeathExitCode,
                     "Expected assertion death (SIGABRT -> kDeathExitCode).");
        };

        expect_death("index_on_empty");
        expect_death("index_past_size");
#else
        QSKIP("Death tests are debug-only (assertions disabled).");
#endif
    }
};

} // namespace

int run_tst_append_buffer_api_paranoid(int argc, char** argv) {
    tst_append_buffer_api_paranoid tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "append_buffer_test.moc"
