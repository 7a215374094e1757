#include "config.hpp"

namespace arbiter {

int BACKEND_OVERHEAD_MS = 10000;        // 10s
int BACKEND_CONNECT_TIMEOUT_MS = 3000;  // 3s
int EXECUTOR_RETRY_DELAY_MS = 200;
int PERSIST_ATTEMPTS = 3;
int PERSIST_BACKOFF_MS = 100;
int STALE_RUNNING_SECONDS = 600;  // 10min
int FETCH_BATCH_SIZE = 8;
int CONTEST_SWEEP_INTERVAL = 30;
int STALE_SWEEP_INTERVAL = 60;
bool DEBUG = false;

}  // namespace arbiter
