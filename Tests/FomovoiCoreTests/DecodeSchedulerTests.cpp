#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "DecodeScheduler.hpp"
#include "TestSupport.hpp"

using namespace fv;
using fv_test::wait_until;

namespace {

Window make_window(size_t n = 16) {
    Window w;
    w.samples.assign(n, 1);
    return w;
}

/// Lets a test decide exactly when each decode returns.
class Gate {
public:
    void open(int64_t index) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            open_.insert(index);
        }
        cv_.notify_all();
    }

    void open_all() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            all_ = true;
        }
        cv_.notify_all();
    }

    void wait(int64_t index) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [&] { return all_ || open_.count(index) > 0; });
    }

private:
    std::mutex              mu_;
    std::condition_variable cv_;
    std::set<int64_t>       open_;
    bool                    all_ = false;
};

} // namespace

static void test_drain_is_in_index_order_whatever_the_completion_order() {
    // Later windows finish first.
    DecodeScheduler scheduler([](const Window& w) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5 * (8 - w.sequence_index)));
        return "w" + std::to_string(w.sequence_index);
    }, 4);

    for (int i = 0; i < 8; ++i) {
        int64_t idx = scheduler.submit(make_window());
        assert(idx == i);
    }
    std::string text = scheduler.drain_all();
    assert(text == "w0 w1 w2 w3 w4 w5 w6 w7");
    assert(scheduler.resolved_count() == 8);
}

static void test_prefix_never_skips_a_gap_and_never_shrinks() {
    Gate gate;
    DecodeScheduler scheduler([&gate](const Window& w) {
        gate.wait(w.sequence_index);
        return "t" + std::to_string(w.sequence_index);
    }, 4);

    for (int i = 0; i < 4; ++i) scheduler.submit(make_window());

    const int64_t order[] = {2, 0, 3, 1};
    const char* expected[] = {"", "t0", "t0", "t0 t1 t2 t3"};
    std::string previous;
    for (int step = 0; step < 4; ++step) {
        gate.open(order[step]);
        bool resolved = wait_until([&] { return scheduler.resolved_count() == step + 1; });
        assert(resolved);

        std::string prefix = scheduler.poll_ordered_prefix();
        assert(prefix == expected[step]);
        assert(prefix.size() >= previous.size());
        assert(prefix.compare(0, previous.size(), previous) == 0);
        previous = prefix;
    }

    int64_t count = 0;
    scheduler.poll_ordered_prefix(&count);
    assert(count == 4);
    assert(scheduler.drain_all() == "t0 t1 t2 t3");
}

static void test_failed_or_empty_decodes_become_empty_text() {
    DecodeScheduler scheduler([](const Window& w) -> std::string {
        if (w.sequence_index == 1) throw std::runtime_error("engine hiccup");
        if (w.sequence_index == 2) return "";
        return "x" + std::to_string(w.sequence_index);
    }, 2);

    for (int i = 0; i < 4; ++i) scheduler.submit(make_window());
    assert(scheduler.drain_all() == "x0 x3");
    assert(scheduler.failure_count() == 1);
}

static void test_consecutive_failures_reset_on_success() {
    std::atomic<bool> fail{true};
    DecodeScheduler scheduler([&fail](const Window&) -> std::string {
        if (fail.load()) throw std::runtime_error("down");
        return "ok";
    }, 1);

    scheduler.submit(make_window());
    scheduler.submit(make_window());
    scheduler.drain_all();
    assert(scheduler.consecutive_failures() == 2);

    fail.store(false);
    scheduler.submit(make_window());
    assert(scheduler.drain_all() == "ok");
    assert(scheduler.consecutive_failures() == 0);
    assert(scheduler.failure_count() == 2);
}

static void test_non_standard_throw_becomes_empty_text() {
    DecodeScheduler scheduler([](const Window& w) -> std::string {
        if (w.sequence_index == 0) throw 42;
        return "ok" + std::to_string(w.sequence_index);
    }, 1);
    std::atomic<int> callbacks{0};
    scheduler.set_completion_callback([&callbacks](int64_t, const std::string&) {
        ++callbacks;
        throw 7;
    });

    scheduler.submit(make_window());
    scheduler.submit(make_window());
    assert(scheduler.drain_all() == "ok1");
    assert(scheduler.failure_count() == 1);

    // The single worker survived both throws and keeps decoding.
    scheduler.submit(make_window());
    assert(scheduler.drain_all() == "ok1 ok2");
    scheduler.wait_idle();
    assert(callbacks.load() == 3);
}

static void test_completion_callback_fires_once_per_window() {
    DecodeScheduler scheduler([](const Window& w) { return std::to_string(w.sequence_index); }, 3);
    std::mutex mu;
    std::vector<int64_t> seen;
    scheduler.set_completion_callback([&](int64_t index, const std::string& text) {
        assert(text == std::to_string(index));
        std::lock_guard<std::mutex> lock(mu);
        seen.push_back(index);
    });

    for (int i = 0; i < 5; ++i) scheduler.submit(make_window());
    scheduler.drain_all();
    scheduler.wait_idle();

    std::lock_guard<std::mutex> lock(mu);
    std::sort(seen.begin(), seen.end());
    assert((seen == std::vector<int64_t>{0, 1, 2, 3, 4}));
}

static void test_reset_restarts_numbering() {
    DecodeScheduler scheduler([](const Window& w) { return "r" + std::to_string(w.sequence_index); }, 2);
    scheduler.submit(make_window());
    scheduler.submit(make_window());
    assert(scheduler.drain_all() == "r0 r1");

    scheduler.reset();
    assert(scheduler.submitted_count() == 0);
    assert(scheduler.poll_ordered_prefix().empty());
    assert(scheduler.submit(make_window()) == 0);
    assert(scheduler.drain_all() == "r0");
}

static void test_drain_of_nothing_returns_immediately() {
    DecodeScheduler scheduler([](const Window&) { return std::string("never"); }, 1);
    assert(scheduler.drain_all().empty());
}

static void test_cancel_wakes_drain_and_discards_results() {
    Gate gate;
    DecodeScheduler scheduler([&gate](const Window& w) {
        gate.wait(w.sequence_index);
        return std::string("late");
    }, 1);

    scheduler.submit(make_window());
    scheduler.submit(make_window());   // queued behind the first

    std::string drained = "unset";
    std::thread drainer([&] { drained = scheduler.drain_all(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    scheduler.cancel();
    drainer.join();
    assert(drained.empty());

    gate.open_all();
    scheduler.wait_idle();
    assert(scheduler.resolved_count() == 0);
    assert(scheduler.poll_ordered_prefix().empty());
}

int main() {
    test_drain_is_in_index_order_whatever_the_completion_order();
    test_prefix_never_skips_a_gap_and_never_shrinks();
    test_failed_or_empty_decodes_become_empty_text();
    test_consecutive_failures_reset_on_success();
    test_non_standard_throw_becomes_empty_text();
    test_completion_callback_fires_once_per_window();
    test_reset_restarts_numbering();
    test_drain_of_nothing_returns_immediately();
    test_cancel_wakes_drain_and_discards_results();
    return 0;
}
