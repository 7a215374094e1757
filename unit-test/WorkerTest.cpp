#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/memory_store.hpp"
#include "test/mocks.hpp"
#include "worker.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::server::mock;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

// 这是唯一一个调用 stop_workers 的测试，停止之后 worker 不能再次启动
TEST(WorkerTest, JudgeAllPendingSubmissions) {
    memory_store store;
    NiceMock<mock_execution_client> client;
    NiceMock<mock_statistics_sink> statistics;
    language_registry registry;
    testcase_runner runner(client, registry);
    orchestrator judge(store, store, statistics, registry, runner);

    testcase tc;
    tc.testcase_id = "t1";
    tc.input = "1 2";
    tc.expected_output = "3";
    store.testcases["p1"] = {tc};
    ON_CALL(client, execute(_)).WillByDefault(Return(make_outcome(3, "3\n")));

    const int count = 20;
    for (int i = 0; i < count; ++i) {
        submission submit;
        submit.sub_id = "s" + to_string(i);
        submit.user_id = "u" + to_string(i % 3);
        submit.target = problem_target{"p1"};
        submit.language = i == 7 ? "COBOL" : "CPP";
        store.add_submission(submit);
    }

    concurrent_queue<string> task_queue;
    vector<thread> workers;
    for (size_t i = 0; i < 4; ++i)
        workers.push_back(start_worker(i, task_queue, judge, store));

    auto all_terminal = [&] {
        for (int i = 0; i < count; ++i)
            if (!is_terminal(store.load("s" + to_string(i)).state)) return false;
        return true;
    };
    for (int i = 0; i < 500 && !all_terminal(); ++i)
        this_thread::sleep_for(chrono::milliseconds(10));

    stop_workers();
    for (auto &th : workers) th.join();

    for (int i = 0; i < count; ++i) {
        string sub_id = "s" + to_string(i);
        if (i == 7) {
            EXPECT_EQ(status::SYSTEM_ERROR, store.load(sub_id).state);
            EXPECT_TRUE(store.results_of(sub_id).empty());
        } else {
            EXPECT_EQ(status::ACCEPTED, store.load(sub_id).state) << sub_id;
            // 每个提交只评测一次
            EXPECT_EQ(1u, store.results_of(sub_id).size()) << sub_id;
        }
    }
}
