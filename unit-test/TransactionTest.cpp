#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "server/mysql/transaction.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::server::mysql;

struct fake_connection {
    bool begin_ok = true, commit_ok = true;
    int commits = 0, rollbacks = 0;

    bool begin() { return begin_ok; }

    bool commit() {
        ++commits;
        return commit_ok;
    }

    bool rollback() {
        ++rollbacks;
        return true;
    }
};

TEST(TransactionTest, CommitDoesNotRollback) {
    fake_connection db;
    {
        transaction trans(db);
        trans.commit();
    }
    EXPECT_EQ(1, db.commits);
    EXPECT_EQ(0, db.rollbacks);
}

TEST(TransactionTest, RollbackWithoutCommit) {
    fake_connection db;
    { transaction trans(db); }
    EXPECT_EQ(0, db.commits);
    EXPECT_EQ(1, db.rollbacks);
}

TEST(TransactionTest, FailedCommitRollsBack) {
    fake_connection db;
    db.commit_ok = false;
    {
        transaction trans(db);
        EXPECT_THROW(trans.commit(), database_error);
    }
    EXPECT_EQ(1, db.commits);
    EXPECT_EQ(1, db.rollbacks);
}

TEST(TransactionTest, FailedBegin) {
    fake_connection db;
    db.begin_ok = false;
    EXPECT_THROW(transaction trans(db), database_error);
    EXPECT_EQ(0, db.rollbacks);
}
