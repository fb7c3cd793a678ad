#include <thread>

#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "passk/result_collector.hpp"

using namespace std;
using namespace passk;

class ResultCollectorTest : public ::testing::Test {
};

TEST_F(ResultCollectorTest, OrderedByCandidateNotCompletion) {
    result_collector collector;
    collector.register_task("a", 3);
    collector.record("a", 2, true);
    collector.record("a", 0, false);
    collector.record("a", 1, true);

    task_result_map results = collector.snapshot();
    EXPECT_EQ(results.at("a"), (task_result_set{false, true, true}));
}

TEST_F(ResultCollectorTest, UnfilledSlotsDropped) {
    result_collector collector;
    collector.register_task("a", 3);
    collector.register_task("b", 2);
    collector.record("a", 1, true);

    task_result_map results = collector.snapshot();
    EXPECT_EQ(results.at("a"), task_result_set{true});
    ASSERT_EQ(results.count("b"), 1u);
    EXPECT_TRUE(results.at("b").empty());
}

TEST_F(ResultCollectorTest, UnknownTaskOrCandidate) {
    result_collector collector;
    collector.register_task("a", 2);
    EXPECT_THROW(collector.record("b", 0, true), internal_error);
    EXPECT_THROW(collector.record("a", 2, true), internal_error);
}

TEST_F(ResultCollectorTest, ConcurrentRecording) {
    const int tasks = 8, samples = 200, threads_count = 8;
    result_collector collector;
    for (int t = 0; t < tasks; ++t) collector.register_task("task" + to_string(t), samples);

    vector<thread> threads;
    for (int w = 0; w < threads_count; ++w) {
        threads.emplace_back([&, w] {
            // 每个线程负责一部分样本，按倒序写入
            for (int t = 0; t < tasks; ++t)
                for (int s = samples - 1 - w; s >= 0; s -= threads_count)
                    collector.record("task" + to_string(t), s, (s + t) % 3 == 0);
        });
    }
    for (auto &th : threads) th.join();

    task_result_map results = collector.snapshot();
    ASSERT_EQ(results.size(), static_cast<size_t>(tasks));
    for (int t = 0; t < tasks; ++t) {
        auto &passes = results.at("task" + to_string(t));
        ASSERT_EQ(passes.size(), static_cast<size_t>(samples));
        for (int s = 0; s < samples; ++s)
            EXPECT_EQ(passes[s], (s + t) % 3 == 0) << "task" << t << " sample " << s;
    }
}
