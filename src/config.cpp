#include "config.hpp"

namespace mjudge {
using namespace std;

double TRUSTED_SANDBOX_MAX_TIME = 120;             // 120s
size_t TRUSTED_SANDBOX_MAX_MEMORY_KIB = 4194304;  // 4G
double COMPILATION_MAX_TIME = 10;                  // 10s
size_t COMPILATION_MAX_MEMORY_KIB = 524288;       // 512M

filesystem::path TEMP_DIR = "/tmp/mjudge";
filesystem::path STORAGE_DIR = "/tmp/mjudge/storage";
string SANDBOX_BACKEND = "runguard";
bool KEEP_SANDBOX = false;
bool DEBUG = false;

}  // namespace mjudge
