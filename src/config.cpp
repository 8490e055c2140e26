#include "config.hpp"

namespace grader {
using namespace std;

double DEFAULT_TIMEOUT = 600;        // 10min
long DEFAULT_MEM_LIMIT = 1L << 21;   // 2G
long DEFAULT_FILE_LIMIT = 1L << 19;  // 512M
long MIN_FREE_SPACE = 1L << 16;      // 64M

filesystem::path EXEC_DIR;
filesystem::path RUN_DIR;
bool DEBUG = false;

}  // namespace grader
