#pragma once

#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace arbiter::server::mysql {

/**
 * @brief 事务，析构时如果没有成功提交则回滚
 * @tparam DB 提供 begin、commit、rollback 的数据库连接，比如 ormpp::dbng<ormpp::mysql>
 */
template <typename DB>
struct transaction {
    explicit transaction(DB &db) : db(db) {
        if (!db.begin()) throw database_error("Unable to begin transaction");
    }

    ~transaction() {
        if (!finished && !db.rollback())
            LOG(WARNING) << "Unable to rollback transaction";
    }

    /**
     * @throw database_error 提交失败，事务会在析构时回滚
     */
    void commit() {
        if (!db.commit()) throw database_error("Unable to commit transaction");
        finished = true;
    }

private:
    DB &db;
    bool finished = false;
};

}  // namespace arbiter::server::mysql
