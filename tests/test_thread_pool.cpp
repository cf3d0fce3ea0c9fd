#include <sandcell/core/thread_pool.hpp>
#include <sandcell/core/logger.hpp>

#include <atomic>
#include <cassert>
#include <stdexcept>

static void testShutdownDrainsQueue() {
    std::atomic<int> done(0);
    sandcell::ThreadPool pool(3);
    assert(pool.size() == 3);

    for (int i = 0; i < 100; ++i) {
        assert(pool.enqueue([&done] { ++done; }));
    }
    pool.shutdown();
    assert(done.load() == 100);
    assert(pool.pending() == 0);
}

static void testRejectsAfterShutdown() {
    sandcell::ThreadPool pool(1);
    pool.shutdown();
    assert(!pool.enqueue([] {}));
    // Second shutdown is a no-op
    pool.shutdown();
}

static void testThrowingTaskKeepsWorkerAlive() {
    std::atomic<int> done(0);
    sandcell::ThreadPool pool(1);
    assert(pool.enqueue([] { throw std::runtime_error("boom"); }));
    assert(pool.enqueue([&done] { ++done; }));
    pool.shutdown();
    assert(done.load() == 1);
}

static void testZeroThreadsMeansOne() {
    std::atomic<int> done(0);
    sandcell::ThreadPool pool(0);
    assert(pool.size() == 1);
    assert(pool.enqueue([&done] { ++done; }));
    pool.shutdown();
    assert(done.load() == 1);
}

int main() {
    sandcell::Logger::instance().set_level(sandcell::LogLevel::ERROR);
    testShutdownDrainsQueue();
    testRejectsAfterShutdown();
    testThrowingTaskKeepsWorkerAlive();
    testZeroThreadsMeansOne();
    return 0;
}
