#include "judgebox/config.hpp"

namespace judgebox {
using namespace std;

int64_t DEFAULT_CPU_TIME_LIMIT = 1000;     // 1s
int64_t DEFAULT_WALL_TIME_LIMIT = 10000;   // 10s
int64_t WALL_TIME_GRACE = 1000;            // 1s
int64_t DEFAULT_MEMORY_LIMIT = 1 << 18;    // 256M
int64_t DEFAULT_OUTPUT_LIMIT = 1 << 16;    // 64M
int ADDRESS_SPACE_FACTOR = 2;

chrono::milliseconds WATCHDOG_TICK(10);

vector<filesystem::path> DEFAULT_READ_MOUNTS = {"/bin", "/usr", "/lib", "/lib64", "/etc"};

vector<string> ACCOUNTED_SUBSYSTEMS = {"cpu", "cpuacct", "memory", "pids"};

}  // namespace judgebox
