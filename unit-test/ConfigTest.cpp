#include <nlohmann/json.hpp>
#include "gtest/gtest.h"
#include "server/common/config.hpp"

using namespace std;
using namespace arbiter;
using namespace nlohmann;

TEST(ConfigTest, Backend) {
    auto backend = json::parse(R"({"url": "http://judge0:2358//"})").get<server::backend>();
    EXPECT_EQ("http://judge0:2358", backend.url);
    EXPECT_EQ("", backend.auth_token);

    backend = json::parse(R"({"url": "https://ce.judge0.com", "auth_token": "secret"})").get<server::backend>();
    EXPECT_EQ("https://ce.judge0.com", backend.url);
    EXPECT_EQ("secret", backend.auth_token);
}

TEST(ConfigTest, Database) {
    auto db = json::parse(R"({"host": "127.0.0.1", "user": "root", "password": "", "database": "platform"})").get<server::database>();
    EXPECT_EQ("platform", db.database);
    EXPECT_EQ(5, db.timeout);
    EXPECT_THROW(json::parse(R"({"host": "127.0.0.1"})").get<server::database>(), json::out_of_range);
}

TEST(ConfigTest, Runner) {
    auto runner = json::object().get<server::runner>();
    EXPECT_EQ(server::failure_policy::STOP_ON_FIRST_FAILURE, runner.policy);
    EXPECT_EQ(1, runner.max_retries);

    runner = json::parse(R"({"policy": "run-all", "max_retries": 3})").get<server::runner>();
    EXPECT_EQ(server::failure_policy::RUN_ALL, runner.policy);
    EXPECT_EQ(3, runner.max_retries);

    EXPECT_THROW(json::parse(R"({"policy": "best-effort"})").get<server::runner>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"max_retries": -1})").get<server::runner>(), invalid_argument);
}
