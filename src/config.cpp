#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path EXEC_DIR;
filesystem::path CACHE_DIR;
filesystem::path RUNGUARD;
filesystem::path PYTHON_HOST;
string NODE_EXECUTABLE = "node";
int SANDBOX_INIT_TIMEOUT_MS = 5000;
int RUNTIME_LOAD_TIMEOUT_MS = 30000;
int MAX_DEFERRED_DELAY_MS = 5000;
size_t MAX_MESSAGE_SIZE = 64 << 20;
double MEMORY_CRITICAL_GB = 2.0;
double MEMORY_LOW_GB = 3.0;
bool DEBUG = false;

}  // namespace grader
