#include <gtest/gtest.h>

#include "mt/thread_pool.h"

#include <atomic>
#include <numeric>

TEST(ThreadPool, ProcessesEveryJob) {
  std::vector<int> jobs(100);
  std::iota(jobs.begin(), jobs.end(), 1);

  std::atomic<int> sum = 0;
  size_t processed = 0;
  {
    thread_pool<int> pool{4,
                          [&](int&& v) {
                            sum += v;
                            return true;
                          },
                          jobs};
    while (pool.processed() < jobs.size())
      std::this_thread::yield();
    processed = pool.processed();
  }

  EXPECT_EQ(processed, 100u);
  EXPECT_EQ(sum.load(), 5050);
}

TEST(ThreadPool, HaltsWhenJobReturnsFalse) {
  std::vector<int> jobs(10);
  std::iota(jobs.begin(), jobs.end(), 1);

  std::vector<int> seen;
  {
    // a single worker takes jobs in submission order
    thread_pool<int> pool{1,
                          [&](int&& v) {
                            seen.push_back(v);
                            return v != 4;
                          },
                          jobs};
    while (!pool.halted())
      std::this_thread::yield();

    EXPECT_THROW(pool.submit(11), std::runtime_error);
  }

  EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 4}));
}

TEST(ThreadPool, DrainsSubmittedWorkOnDestruction) {
  std::atomic<int> count = 0;
  {
    thread_pool<std::string> pool{2,
                                  [&](std::string&& s) {
                                    count += static_cast<int>(s.size());
                                    return true;
                                  },
                                  {}};
    for (int i = 0; i < 5; i++)
      pool.submit(3, 'x');
  }

  EXPECT_EQ(count.load(), 15);
}

TEST(ThreadPool, EmptyInputFinishes) {
  std::atomic<int> count = 0;
  {
    thread_pool<int> pool{3,
                          [&](int&&) {
                            count++;
                            return true;
                          },
                          {}};
  }
  EXPECT_EQ(count.load(), 0);
}
