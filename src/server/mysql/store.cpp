#include "server/mysql/store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cstdint>
#include <optional>
#include <tuple>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "server/mysql/transaction.hpp"

namespace arbiter::server::mysql {
using namespace std;
using namespace ormpp;

/**
 * @brief 执行数据库操作，将 ormpp 抛出的异常转换为 database_error
 */
template <typename F>
static auto guarded(const char *operation, F &&f) -> decltype(f()) {
    try {
        return f();
    } catch (runtime_error &ex) {
        throw database_error(fmt::format("{}: {}", operation, ex.what()));
    }
}

template <typename... Args>
static void checked_execute(dbng<ormpp::mysql> &db, const char *sql, Args &&...args) {
    if (!db.execute(sql, std::forward<Args>(args)...))
        throw database_error(fmt::format("Unable to execute {}", sql));
}

static optional<string> nullable(const string &value) {
    if (value.empty()) return nullopt;
    return value;
}

static contest_item_target::item_kind parse_item_kind(const string &type) {
    if (type == "CHALLENGE") return contest_item_target::item_kind::CHALLENGE;
    return contest_item_target::item_kind::PROBLEM;
}

store::store(const database &config) {
    if (!db.connect(config.host.c_str(), config.user.c_str(), config.password.c_str(), config.database.c_str(), config.timeout))
        throw database_error(fmt::format("Unable to connect to database {}@{}", config.database, config.host));
    LOG(INFO) << "Connected to database " << config.database << "@" << config.host;
}

// clang-format off
static const string SUBMISSION_SELECT =
    "SELECT CAST(s.id AS CHAR), CAST(s.user_id AS CHAR), "
    "IFNULL(CAST(s.problem_id AS CHAR), ''), IFNULL(CAST(s.contest_item_id AS CHAR), ''), "
    "IFNULL(CAST(s.contest_id AS CHAR), ''), IFNULL(CAST(i.contest_id AS CHAR), ''), "
    "IFNULL(i.item_type, 'PROBLEM'), IFNULL(CAST(IFNULL(i.problem_id, i.challenge_id) AS CHAR), ''), "
    "s.language, ";

static const string SUBMISSION_FROM =
    ", s.status, "
    "DATE_FORMAT(s.created_at, '%Y-%m-%d %H:%i:%s'), DATE_FORMAT(s.updated_at, '%Y-%m-%d %H:%i:%s'), "
    "IFNULL(DATE_FORMAT(s.judging_started_at, '%Y-%m-%d %H:%i:%s'), '') "
    "FROM submissions_submission s LEFT JOIN contest_contestitem i ON s.contest_item_id = i.id ";
// clang-format on

vector<submission> store::query_submissions(const char *condition, const string &arg, bool with_source) {
    // 计算排行榜时不需要读取源代码
    string sql = SUBMISSION_SELECT + (with_source ? "s.source_code" : "''") + SUBMISSION_FROM + condition;
    auto rows = guarded("query submissions", [&] {
        return db.query<tuple<string, string, string, string, string, string, string, string, string, string, string, string, string, string>>(
            sql.c_str(), arg);
    });

    vector<submission> submissions;
    for (auto &row : rows) {
        submission submit;
        string problem_id, item_id, contest_id, item_contest_id, item_type, wrapped_id, state, created_at, updated_at, started_at;
        tie(submit.sub_id, submit.user_id, problem_id, item_id, contest_id, item_contest_id, item_type, wrapped_id,
            submit.language, submit.source_code, state, created_at, updated_at, started_at) = row;
        submit.target = make_target(nullable(problem_id), nullable(item_id), nullable(contest_id),
                                    nullable(item_contest_id), parse_item_kind(item_type), wrapped_id);
        submit.state = parse_short_code(state);
        submit.created_at = parse_datetime(created_at);
        submit.updated_at = parse_datetime(updated_at);
        submit.judging_started_at = parse_datetime(started_at);
        submissions.push_back(move(submit));
    }
    return submissions;
}

submission store::load(const string &sub_id) {
    scoped_lock lock(mut);
    auto submissions = query_submissions("WHERE s.id=?", sub_id, true);
    if (submissions.empty())
        throw invalid_submission("Submission " + sub_id + " does not exist");
    return submissions.front();
}

vector<string> store::fetch_pending(size_t limit) {
    scoped_lock lock(mut);
    auto rows = guarded("fetch pending submissions", [&] {
        return db.query<tuple<string>>(
            "SELECT CAST(id AS CHAR) FROM submissions_submission WHERE status='PENDING' ORDER BY created_at, id LIMIT ?",
            (int)limit);
    });
    vector<string> ids;
    for (auto &[id] : rows) ids.push_back(id);
    return ids;
}

bool store::try_begin(const string &sub_id, time_t now) {
    scoped_lock lock(mut);
    return guarded("begin judging", [&] {
        transaction trans(db);
        auto rows = db.query<tuple<string>>(
            "SELECT status FROM submissions_submission WHERE id=? FOR UPDATE", sub_id);
        if (rows.empty() || get<0>(rows[0]) != get_short_code(status::PENDING))
            return false;
        checked_execute(db, "UPDATE submissions_submission SET status=?, judging_started_at=?, updated_at=? WHERE id=?",
                        string(get_short_code(status::RUNNING)), format_datetime(now), format_datetime(now), sub_id);
        trans.commit();
        return true;
    });
}

completion store::complete(const string &sub_id, time_t started_at, status verdict,
                           const vector<testcase_result> &results, time_t now) {
    scoped_lock lock(mut);
    return guarded("persist verdict", [&] {
        completion result;
        transaction trans(db);
        auto rows = db.query<tuple<string, string, string, string, string, string>>(
            "SELECT s.status, IFNULL(DATE_FORMAT(s.judging_started_at, '%Y-%m-%d %H:%i:%s'), ''), IFNULL(i.item_type, 'PROBLEM'), "
            "CAST(s.user_id AS CHAR), IFNULL(CAST(s.problem_id AS CHAR), ''), IFNULL(CAST(s.contest_item_id AS CHAR), '') "
            "FROM submissions_submission s LEFT JOIN contest_contestitem i ON s.contest_item_id = i.id "
            "WHERE s.id=? FOR UPDATE",
            sub_id);
        if (rows.empty()) return result;
        auto &[state, started, item_type, user_id, problem_id, item_id] = rows[0];
        if (state != get_short_code(status::RUNNING) || parse_datetime(started) != started_at)
            return result;

        if (verdict == status::ACCEPTED && !problem_id.empty() && item_id.empty()) {
            // 锁住同一用户同一题目的其他 AC 提交，并发的 AC 只有一个能看到空结果
            auto accepted = db.query<tuple<string>>(
                "SELECT CAST(id AS CHAR) FROM submissions_submission "
                "WHERE user_id=? AND problem_id=? AND status='AC' AND id != ? FOR UPDATE",
                user_id, problem_id, sub_id);
            result.first_accepted = accepted.empty();
        }

        string created_at = format_datetime(now);
        for (auto &item : results) {
            checked_execute(
                db, "INSERT INTO submissions_submissionresult (submission_id, test_case_id, test_case_type, is_sample, is_hidden, "
                "status, actual_output, stderr, execution_time, memory_used, created_at) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                sub_id, item.testcase_id, item_type, (int)item.is_sample, (int)item.is_hidden,
                string(get_short_code(item.status)), sanitize_utf8(item.stdout_text), sanitize_utf8(item.stderr_text),
                item.time_ms, item.memory_kb, created_at);
        }
        checked_execute(db, "UPDATE submissions_submission SET status=?, updated_at=?, judging_started_at=NULL WHERE id=?",
                        string(get_short_code(verdict)), created_at, sub_id);
        trans.commit();
        result.completed = true;
        return result;
    });
}

bool store::reject(const string &sub_id, status verdict, time_t now) {
    scoped_lock lock(mut);
    return guarded("reject submission", [&] {
        transaction trans(db);
        auto rows = db.query<tuple<string>>(
            "SELECT status FROM submissions_submission WHERE id=? FOR UPDATE", sub_id);
        if (rows.empty() || get<0>(rows[0]) != get_short_code(status::PENDING))
            return false;
        checked_execute(db, "UPDATE submissions_submission SET status=?, updated_at=? WHERE id=?",
                        string(get_short_code(verdict)), format_datetime(now), sub_id);
        trans.commit();
        return true;
    });
}

vector<testcase_result> store::results_of(const string &sub_id) {
    scoped_lock lock(mut);
    auto rows = guarded("query testcase results", [&] {
        return db.query<tuple<string, int, int, string, string, string, int, int>>(
            "SELECT IFNULL(CAST(test_case_id AS CHAR), ''), is_sample, is_hidden, status, IFNULL(actual_output, ''), "
            "IFNULL(stderr, ''), IFNULL(execution_time, 0), IFNULL(memory_used, 0) "
            "FROM submissions_submissionresult WHERE submission_id=? ORDER BY id",
            sub_id);
    });

    vector<testcase_result> results;
    for (auto &[testcase_id, is_sample, is_hidden, state, stdout_text, stderr_text, time_ms, memory_kb] : rows) {
        testcase_result result;
        result.testcase_id = testcase_id;
        result.is_sample = is_sample;
        result.is_hidden = is_hidden;
        result.status = parse_short_code(state);
        result.stdout_text = stdout_text;
        result.stderr_text = stderr_text;
        result.time_ms = time_ms;
        result.memory_kb = memory_kb;
        results.push_back(move(result));
    }
    return results;
}

vector<string> store::find_stale_running(time_t started_before) {
    scoped_lock lock(mut);
    auto rows = guarded("query stale submissions", [&] {
        return db.query<tuple<string>>(
            "SELECT CAST(id AS CHAR) FROM submissions_submission WHERE status='RUNNING' AND judging_started_at < ? ORDER BY id",
            format_datetime(started_before));
    });
    vector<string> ids;
    for (auto &[id] : rows) ids.push_back(id);
    return ids;
}

bool store::reoffer(const string &sub_id, time_t started_before) {
    scoped_lock lock(mut);
    return guarded("re-offer submission", [&] {
        transaction trans(db);
        auto rows = db.query<tuple<string, string>>(
            "SELECT status, IFNULL(DATE_FORMAT(judging_started_at, '%Y-%m-%d %H:%i:%s'), '') "
            "FROM submissions_submission WHERE id=? FOR UPDATE",
            sub_id);
        if (rows.empty()) return false;
        auto &[state, started] = rows[0];
        if (state != get_short_code(status::RUNNING) || parse_datetime(started) >= started_before)
            return false;
        checked_execute(db, "UPDATE submissions_submission SET status=?, judging_started_at=NULL WHERE id=?",
                        string(get_short_code(status::PENDING)), sub_id);
        trans.commit();
        return true;
    });
}

vector<submission> store::contest_submissions(const string &contest_id) {
    scoped_lock lock(mut);
    return query_submissions("WHERE s.contest_id=? ORDER BY s.created_at, s.id", contest_id, false);
}

vector<testcase> store::testcases_for(const submission_target &target) {
    string table, column, id;
    if (auto *problem = get_if<problem_target>(&target.value)) {
        table = "problems_problemtestcase", column = "problem_id", id = problem->problem_id;
    } else {
        auto &item = get<contest_item_target>(target.value);
        if (item.kind == contest_item_target::item_kind::CHALLENGE)
            table = "challenges_challengetestcase", column = "challenge_id";
        else
            table = "problems_problemtestcase", column = "problem_id";
        id = item.wrapped_id;
    }

    string sql = fmt::format(
        "SELECT CAST(id AS CHAR), id, input_data, expected_output, is_sample, {} FROM {} WHERE {}=?",
        table == "challenges_challengetestcase" ? "is_hidden" : "0", table, column);

    scoped_lock lock(mut);
    auto rows = guarded("query testcases", [&] {
        return db.query<tuple<string, int, string, string, int, int>>(sql.c_str(), id);
    });

    vector<testcase> testcases;
    for (auto &[testcase_id, sequence, input, expected_output, is_sample, is_hidden] : rows) {
        testcase tc;
        tc.testcase_id = testcase_id;
        tc.sequence = sequence;
        tc.input = input;
        tc.expected_output = expected_output;
        tc.is_sample = is_sample;
        tc.is_hidden = is_hidden;
        testcases.push_back(move(tc));
    }
    return testcases;
}

resource_limits store::limits_for(const submission_target &target) {
    string problem_id;
    if (auto *problem = get_if<problem_target>(&target.value)) {
        problem_id = problem->problem_id;
    } else {
        auto &item = get<contest_item_target>(target.value);
        // 挑战没有资源限制，使用默认值
        if (item.kind == contest_item_target::item_kind::CHALLENGE)
            return resource_limits();
        problem_id = item.wrapped_id;
    }

    scoped_lock lock(mut);
    auto rows = guarded("query resource limits", [&] {
        return db.query<tuple<int, int>>(
            "SELECT time_limit, memory_limit FROM problems_problem WHERE id=?", problem_id);
    });
    if (rows.empty())
        throw invalid_submission("Problem " + problem_id + " does not exist");

    resource_limits limits;
    limits.time_limit_ms = get<0>(rows[0]);
    limits.memory_limit_kb = get<1>(rows[0]) * 1024;  // 题目的内存限制单位为 MB
    return limits;
}

contest store::load_contest(const string &contest_id) {
    scoped_lock lock(mut);
    return guarded("query contest", [&] {
        auto rows = db.query<tuple<string, string, string, string, string, string>>(
            "SELECT CAST(id AS CHAR), title, DATE_FORMAT(start_time, '%Y-%m-%d %H:%i:%s'), "
            "DATE_FORMAT(end_time, '%Y-%m-%d %H:%i:%s'), CAST(created_by_id AS CHAR), state "
            "FROM contest_contest WHERE id=?",
            contest_id);
        if (rows.empty())
            throw invalid_argument("Contest " + contest_id + " does not exist");

        contest c;
        string start_time, end_time, phase;
        tie(c.contest_id, c.title, start_time, end_time, c.creator_id, phase) = rows[0];
        c.start_time = parse_datetime(start_time);
        c.end_time = parse_datetime(end_time);
        c.phase = parse_phase(phase);

        for (auto &[manager_id] : db.query<tuple<string>>(
                 "SELECT CAST(user_id AS CHAR) FROM contest_contest_managers WHERE contest_id=?", contest_id))
            c.manager_ids.push_back(manager_id);

        for (auto &[item_id, title, score] : db.query<tuple<string, string, double>>(
                 "SELECT CAST(i.id AS CHAR), IFNULL(p.title, IFNULL(ch.title, '')), i.score "
                 "FROM contest_contestitem i "
                 "LEFT JOIN problems_problem p ON i.problem_id = p.id "
                 "LEFT JOIN challenges_challenge ch ON i.challenge_id = ch.id "
                 "WHERE i.contest_id=? ORDER BY i.`order`, i.id",
                 contest_id))
            c.problems.push_back({item_id, title, score});

        for (auto &[user_id, username] : db.query<tuple<string, string>>(
                 "SELECT CAST(u.id AS CHAR), u.username FROM contest_contestparticipant cp "
                 "JOIN accounts_user u ON cp.user_id = u.id WHERE cp.contest_id=? ORDER BY cp.joined_at, cp.id",
                 contest_id))
            c.participants.push_back({user_id, username});

        return c;
    });
}

int store::transition_phases(time_t now) {
    string current = format_datetime(now);
    scoped_lock lock(mut);
    return guarded("transition contest phases", [&] {
        transaction trans(db);
        auto rows = db.query<tuple<int64_t>>(
            "SELECT COUNT(*) FROM contest_contest WHERE "
            "(state='SCHEDULED' AND start_time <= ?) OR (state='LIVE' AND end_time <= ?) FOR UPDATE",
            current, current);
        checked_execute(db, "UPDATE contest_contest SET state='LIVE' WHERE state='SCHEDULED' AND start_time <= ? AND end_time > ?",
                        current, current);
        checked_execute(db, "UPDATE contest_contest SET state='ENDED' WHERE state IN ('SCHEDULED', 'LIVE') AND end_time <= ?",
                        current);
        trans.commit();
        return rows.empty() ? 0 : static_cast<int>(get<0>(rows[0]));
    });
}

void store::problem_solved(const string &user_id, const string &problem_id, const string &sub_id) {
    scoped_lock lock(mut);
    LOG(INFO) << "User " << user_id << " solved problem " << problem_id << " by submission " << sub_id;
    guarded("update user statistics", [&] {
        checked_execute(
            db, "INSERT INTO accounts_userstatistics (user_id, total_solved, acceptance_rate, current_streak) VALUES (?, 1, 0, 0) "
            "ON DUPLICATE KEY UPDATE total_solved = total_solved + 1",
            user_id);
    });
}

}  // namespace arbiter::server::mysql
