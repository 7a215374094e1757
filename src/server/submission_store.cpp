#include "server/submission_store.hpp"

namespace arbiter::server {

submission_store::~submission_store() {}

testcase_source::~testcase_source() {}

contest_source::~contest_source() {}

statistics_sink::~statistics_sink() {}

}  // namespace arbiter::server
