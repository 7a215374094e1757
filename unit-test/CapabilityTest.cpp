#include "access/capability.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace arbiter;

class CapabilityTest : public ::testing::Test {
protected:
    contest c;
    submission submit;
    vector<testcase_result> results;

    void SetUp() override {
        c.contest_id = "c1";
        c.creator_id = "creator";
        c.manager_ids = {"manager"};
        c.phase = contest_phase::LIVE;

        contest_item_target item;
        item.item_id = "i1";
        item.contest_id = "c1";
        item.wrapped_id = "p1";
        submit.sub_id = "s1";
        submit.user_id = "owner";
        submit.target = item;

        results.resize(2);
        results[0].testcase_id = "sample";
        results[0].is_sample = true;
        results[1].testcase_id = "hidden";
        results[1].is_hidden = true;
    }

    static actor user(const string &id, bool superuser = false) {
        actor who;
        who.user_id = id;
        who.is_superuser = superuser;
        return who;
    }
};

TEST_F(CapabilityTest, Capabilities) {
    EXPECT_EQ(capability::NONE, check_capability(actor(), submit, &c));
    EXPECT_EQ(capability::SUPERUSER, check_capability(user("admin", true), submit, &c));
    EXPECT_EQ(capability::SUPERUSER, check_capability(user("owner", true), submit, &c));
    EXPECT_EQ(capability::OWNER, check_capability(user("owner"), submit, &c));
    EXPECT_EQ(capability::CONTEST_MANAGER, check_capability(user("creator"), submit, &c));
    EXPECT_EQ(capability::CONTEST_MANAGER, check_capability(user("manager"), submit, &c));
    EXPECT_EQ(capability::NONE, check_capability(user("stranger"), submit, &c));
    EXPECT_EQ(capability::NONE, check_capability(user("manager"), submit, nullptr));
}

TEST_F(CapabilityTest, ManagerOfAnotherContest) {
    contest other = c;
    other.contest_id = "c2";
    EXPECT_EQ(capability::NONE, check_capability(user("manager"), submit, &other));
}

TEST_F(CapabilityTest, CapabilityNames) {
    EXPECT_STREQ("OWNER", get_capability_name(capability::OWNER));
    EXPECT_STREQ("CONTEST_MANAGER", get_capability_name(capability::CONTEST_MANAGER));
    EXPECT_STREQ("NONE", get_capability_name(capability::NONE));
}

TEST_F(CapabilityTest, LiveContestShowsSamplesOnly) {
    auto visible = visible_results(user("stranger"), submit, &c, results);
    ASSERT_EQ(1u, visible.size());
    EXPECT_EQ("sample", visible[0].testcase_id);

    EXPECT_EQ(2u, visible_results(user("owner"), submit, &c, results).size());
    EXPECT_EQ(2u, visible_results(user("manager"), submit, &c, results).size());
    EXPECT_TRUE(visible_results(actor(), submit, &c, results).empty());
}

TEST_F(CapabilityTest, FinishedContestShowsEverything) {
    c.phase = contest_phase::ENDED;
    EXPECT_EQ(2u, visible_results(user("stranger"), submit, &c, results).size());
    c.phase = contest_phase::ARCHIVED;
    EXPECT_EQ(2u, visible_results(user("stranger"), submit, &c, results).size());
    c.phase = contest_phase::SCHEDULED;
    EXPECT_TRUE(visible_results(user("stranger"), submit, &c, results).empty());
}

TEST_F(CapabilityTest, PracticeSubmission) {
    submit.target = problem_target{"p1"};
    EXPECT_TRUE(visible_results(user("stranger"), submit, nullptr, results).empty());
    EXPECT_EQ(2u, visible_results(user("owner"), submit, nullptr, results).size());
    EXPECT_EQ(2u, visible_results(user("admin", true), submit, nullptr, results).size());
}
