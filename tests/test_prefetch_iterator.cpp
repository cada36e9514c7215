#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <buildlog/utils/iterators/line_iterator.h>
#include <buildlog/utils/iterators/prefetch_iterator.h>
#include <buildlog/utils/reader/error.h>
#include <buildlog/utils/reader/file_source.h>
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "testing_utilities.h"

using namespace buildlog::utils;
using namespace buildlog_test;

namespace {

// Yields 0..count-1, optionally failing after fail_after items
class VectorIterator : public Iterator<int> {
   public:
    explicit VectorIterator(int count, int fail_after = -1,
                            std::chrono::milliseconds delay =
                                std::chrono::milliseconds(0))
        : count_(count), fail_after_(fail_after), delay_(delay) {}

    bool next(int &item) override {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (fail_after_ >= 0 && position_ == fail_after_) {
            throw std::runtime_error("base iterator failed");
        }
        if (position_ >= count_) {
            return false;
        }
        item = position_++;
        ++pulled;
        return true;
    }

    void reset() override {
        if (fail_reset) {
            throw std::runtime_error("base reset failed");
        }
        position_ = 0;
        ++resets;
    }

    void close() override { closed = true; }

    std::atomic<bool> closed{false};
    std::atomic<int> resets{0};
    std::atomic<int> pulled{0};
    std::atomic<bool> fail_reset{false};

   private:
    int count_;
    int fail_after_;
    std::chrono::milliseconds delay_;
    int position_ = 0;
};

std::vector<int> drain(Iterator<int> &iterator) {
    std::vector<int> items;
    int item = 0;
    while (iterator.next(item)) {
        items.push_back(item);
    }
    return items;
}

std::vector<int> sequence(int count) {
    std::vector<int> items;
    for (int i = 0; i < count; ++i) {
        items.push_back(i);
    }
    return items;
}

}  // namespace

TEST_CASE("PrefetchIterator - Preserves order") {
    for (std::size_t prefetch_size : {1, 3, 10, 50, 200}) {
        for (double timeout : {0.001, 0.1}) {
            CAPTURE(prefetch_size);
            CAPTURE(timeout);
            VectorIterator base(100);
            PrefetchIterator<int> prefetch(base, prefetch_size, timeout);
            CHECK(drain(prefetch) == sequence(100));

            int item = 0;
            CHECK_FALSE(prefetch.next(item));
        }
    }
}

TEST_CASE("PrefetchIterator - Queue geometry") {
    VectorIterator base(0);

    SUBCASE("Small prefetch") {
        PrefetchIterator<int> prefetch(base, 3);
        CHECK(prefetch.capacity() == 100);
        CHECK(prefetch.batch_size() == 3);
    }

    SUBCASE("Large prefetch") {
        PrefetchIterator<int> prefetch(base, 80);
        CHECK(prefetch.capacity() == 160);
        CHECK(prefetch.batch_size() == 50);
    }

    SUBCASE("Timeout is clamped") {
        PrefetchIterator<int> fast(base, 3, 0.0);
        CHECK(fast.timeout_seconds() == doctest::Approx(0.001));
        PrefetchIterator<int> slow(base, 3, 30.0);
        CHECK(slow.timeout_seconds() == doctest::Approx(1.0));
    }
}

TEST_CASE("PrefetchIterator - Smaller batch when nearly full") {
    // capacity 160, batch 50: three full batches fit, the fourth finds
    // only 10 free slots and pulls 50 / 4 items instead
    VectorIterator base(1000);
    PrefetchIterator<int> prefetch(base, 80);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    CHECK(base.pulled.load() == 150 + 12);

    CHECK(drain(prefetch) == sequence(1000));
}

TEST_CASE("PrefetchIterator - Timeout adapts to queue pressure") {
    SUBCASE("Grows while the queue stays full") {
        VectorIterator base(1000);
        PrefetchIterator<int> prefetch(base, 3, 0.1);
        std::this_thread::sleep_for(std::chrono::milliseconds(1300));
        CHECK(prefetch.timeout_seconds() > 0.11);
        CHECK(prefetch.timeout_seconds() <= 1.0);
        CHECK(drain(prefetch) == sequence(1000));
    }

    SUBCASE("Shrinks while the consumer waits on an empty queue") {
        VectorIterator base(400, -1, std::chrono::milliseconds(5));
        PrefetchIterator<int> prefetch(base, 3, 0.1);
        auto start = std::chrono::steady_clock::now();
        int item = 0;
        int expected = 0;
        while (std::chrono::steady_clock::now() - start <
               std::chrono::milliseconds(1500)) {
            REQUIRE(prefetch.next(item));
            CHECK(item == expected++);
        }
        CHECK(prefetch.timeout_seconds() < 0.09);
        CHECK(prefetch.timeout_seconds() >= 0.001);
    }
}

TEST_CASE("PrefetchIterator - Base failures reach the consumer") {
    VectorIterator base(100, 7);
    PrefetchIterator<int> prefetch(base, 3);

    std::vector<int> items;
    int item = 0;
    bool raised = false;
    try {
        while (prefetch.next(item)) {
            items.push_back(item);
        }
    } catch (const std::runtime_error &e) {
        raised = true;
        CHECK(std::string(e.what()) == "base iterator failed");
    }
    CHECK(raised);
    CHECK(items == sequence(7));

    // The error is delivered once, then the iterator is exhausted
    CHECK_FALSE(prefetch.next(item));
}

TEST_CASE("PrefetchIterator - Reset") {
    SUBCASE("Restarts the base") {
        VectorIterator base(20);
        PrefetchIterator<int> prefetch(base, 4);
        int item = 0;
        REQUIRE(prefetch.next(item));
        REQUIRE(prefetch.next(item));

        prefetch.reset();
        CHECK(base.resets.load() == 1);
        CHECK(drain(prefetch) == sequence(20));

        prefetch.reset();
        CHECK(drain(prefetch) == sequence(20));
    }

    SUBCASE("Failed base reset leaves the iterator exhausted") {
        VectorIterator base(20);
        PrefetchIterator<int> prefetch(base, 4);
        CHECK(drain(prefetch) == sequence(20));

        base.fail_reset = true;
        CHECK_THROWS_AS(prefetch.reset(), std::runtime_error);
        int item = 0;
        CHECK_FALSE(prefetch.next(item));

        base.fail_reset = false;
        prefetch.reset();
        CHECK(drain(prefetch) == sequence(20));
    }

    SUBCASE("Over a line iterator") {
        TestEnvironment env(150);
        REQUIRE(env.is_valid());
        TextFileSource source(env.create_test_log_file());
        LineIterator lines(source, 128);
        PrefetchIterator<std::string> prefetch(lines, 8);

        std::vector<std::string> first;
        std::string line;
        while (prefetch.next(line)) {
            first.push_back(line);
        }
        CHECK(first.size() == 150);

        prefetch.reset();
        std::vector<std::string> second;
        while (prefetch.next(line)) {
            second.push_back(line);
        }
        CHECK(first == second);
    }
}

TEST_CASE("PrefetchIterator - Close") {
    SUBCASE("Closes the base iterator") {
        VectorIterator base(10);
        PrefetchIterator<int> prefetch(base, 3);
        CHECK(drain(prefetch) == sequence(10));
        prefetch.close();
        CHECK(base.closed.load());

        int item = 0;
        CHECK_FALSE(prefetch.next(item));
    }

    SUBCASE("While the producer is busy") {
        VectorIterator base(1000, -1, std::chrono::milliseconds(2));
        {
            PrefetchIterator<int> prefetch(base, 3);
            int item = 0;
            REQUIRE(prefetch.next(item));
            prefetch.close();
            CHECK_FALSE(prefetch.next(item));
        }
        // Destruction joined the producer, which closed the base on exit
        CHECK(base.closed.load());
    }

    SUBCASE("Destruction alone does not close the base") {
        VectorIterator base(10);
        {
            PrefetchIterator<int> prefetch(base, 3);
            CHECK(drain(prefetch) == sequence(10));
        }
        CHECK_FALSE(base.closed.load());
    }
}

TEST_CASE("PrefetchIterator - Bounded wait") {
    VectorIterator base(3, -1, std::chrono::milliseconds(300));
    PrefetchIterator<int> prefetch(base, 1);

    int item = 0;
    try {
        prefetch.next_for(item, std::chrono::milliseconds(20));
        FAIL("expected ReaderError");
    } catch (const ReaderError &e) {
        CHECK(e.get_type() == ReaderError::TIMEOUT);
    }

    // A generous wait still gets the items in order
    REQUIRE(prefetch.next_for(item, std::chrono::seconds(5)));
    CHECK(item == 0);
    CHECK(prefetch.next(item));
    CHECK(item == 1);
}
