#include <chrono>
#include <thread>
#include "contest/schedule.hpp"
#include "gtest/gtest.h"
#include "test/memory_store.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::server::mock;

TEST(ContestScheduleTest, PhaseAt) {
    EXPECT_EQ(contest_phase::SCHEDULED, phase_at(100, 200, 99));
    EXPECT_EQ(contest_phase::LIVE, phase_at(100, 200, 100));
    EXPECT_EQ(contest_phase::LIVE, phase_at(100, 200, 199));
    EXPECT_EQ(contest_phase::ENDED, phase_at(100, 200, 200));
}

TEST(ContestScheduleTest, PhaseNames) {
    EXPECT_STREQ("LIVE", get_phase_name(contest_phase::LIVE));
    EXPECT_EQ(contest_phase::ARCHIVED, parse_phase("ARCHIVED"));
    EXPECT_THROW(parse_phase("RUNNING"), invalid_argument);
}

class ContestSubmissionTest : public ::testing::Test {
protected:
    contest c;

    void SetUp() override {
        c.contest_id = "c1";
        c.start_time = 1000;
        c.end_time = 2000;
        c.phase = contest_phase::LIVE;
        c.participants = {{"u1", "alice"}};
    }
};

TEST_F(ContestSubmissionTest, Accepted) {
    EXPECT_TRUE(validate_contest_submission(c, "u1", 1500).empty());
}

TEST_F(ContestSubmissionTest, NotParticipant) {
    auto errors = validate_contest_submission(c, "u2", 1500);
    ASSERT_EQ(1u, errors.size());
    EXPECT_EQ("You are not a participant in this contest", errors[0]);
}

TEST_F(ContestSubmissionTest, NotStarted) {
    c.phase = contest_phase::SCHEDULED;
    auto errors = validate_contest_submission(c, "u1", 500);
    ASSERT_EQ(2u, errors.size());
    EXPECT_EQ("Contest is SCHEDULED, not accepting submissions", errors[0]);
    EXPECT_EQ("Contest has not started yet", errors[1]);
}

TEST_F(ContestSubmissionTest, Ended) {
    c.phase = contest_phase::ENDED;
    auto errors = validate_contest_submission(c, "u2", 2500);
    ASSERT_EQ(3u, errors.size());
    EXPECT_EQ("Contest is ENDED, not accepting submissions", errors[0]);
    EXPECT_EQ("Contest has ended", errors[1]);
    EXPECT_EQ("You are not a participant in this contest", errors[2]);
}

TEST(ContestReconcilerTest, ReconcileOnce) {
    memory_store store;
    contest scheduled, live, draft, archived;
    scheduled.contest_id = "scheduled";
    scheduled.start_time = 1000;
    scheduled.end_time = 2000;
    scheduled.phase = contest_phase::SCHEDULED;
    live = scheduled;
    live.contest_id = "live";
    live.phase = contest_phase::LIVE;
    draft = scheduled;
    draft.contest_id = "draft";
    draft.phase = contest_phase::DRAFT;
    archived = scheduled;
    archived.contest_id = "archived";
    archived.phase = contest_phase::ARCHIVED;
    for (auto &c : {scheduled, live, draft, archived})
        store.contests[c.contest_id] = c;

    contest_reconciler reconciler(store, 30);
    EXPECT_EQ(0, reconciler.reconcile_once(500));
    EXPECT_EQ(contest_phase::SCHEDULED, store.contests["scheduled"].phase);
    EXPECT_EQ(contest_phase::LIVE, store.contests["live"].phase);

    EXPECT_EQ(1, reconciler.reconcile_once(1500));
    EXPECT_EQ(contest_phase::LIVE, store.contests["scheduled"].phase);
    EXPECT_EQ(contest_phase::LIVE, store.contests["live"].phase);

    EXPECT_EQ(2, reconciler.reconcile_once(2500));
    EXPECT_EQ(contest_phase::ENDED, store.contests["scheduled"].phase);
    EXPECT_EQ(contest_phase::ENDED, store.contests["live"].phase);
    EXPECT_EQ(contest_phase::DRAFT, store.contests["draft"].phase);
    EXPECT_EQ(contest_phase::ARCHIVED, store.contests["archived"].phase);

    EXPECT_EQ(0, reconciler.reconcile_once(3000));
}

TEST(ContestReconcilerTest, PhasesOnlyMoveForward) {
    memory_store store;
    contest started;
    started.contest_id = "started";
    started.start_time = 1000;
    started.end_time = 2000;
    started.phase = contest_phase::LIVE;
    store.contests["started"] = started;

    // 管理员提前开始了比赛
    contest_reconciler reconciler(store, 30);
    EXPECT_EQ(0, reconciler.reconcile_once(100));
    EXPECT_EQ(contest_phase::LIVE, store.contests["started"].phase);
    EXPECT_EQ(0, reconciler.reconcile_once(1500));
    EXPECT_EQ(1, reconciler.reconcile_once(2000));
    EXPECT_EQ(contest_phase::ENDED, store.contests["started"].phase);
}

TEST(ContestReconcilerTest, StartAndStop) {
    memory_store store;
    contest c;
    c.contest_id = "c1";
    c.start_time = 0;
    c.end_time = 1;
    c.phase = contest_phase::LIVE;
    store.contests["c1"] = c;

    contest_reconciler reconciler(store, 3600);
    reconciler.start();
    // 启动后立即切换一次
    for (int i = 0; i < 200; ++i) {
        if (store.load_contest("c1").phase == contest_phase::ENDED) break;
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    reconciler.stop();
    EXPECT_EQ(contest_phase::ENDED, store.load_contest("c1").phase);
}
