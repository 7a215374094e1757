#include "executor/execution_client.hpp"

namespace arbiter {

execution_client::~execution_client() {}

}  // namespace arbiter
