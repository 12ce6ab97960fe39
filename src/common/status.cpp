#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace mjudge {
using namespace std;

// clang-format off
static const unordered_map<exit_status, const char *> status_message = boost::assign::map_list_of
    (exit_status::OK, "Execution completed successfully")
    (exit_status::TIMEOUT, "Execution timed out")
    (exit_status::TIMEOUT_WALL, "Execution timed out (wall clock limit exceeded)")
    (exit_status::SIGNAL, "Execution killed (could be triggered by violating memory limits)")
    (exit_status::NONZERO_RETURN, "Execution failed because the return code was nonzero")
    (exit_status::SANDBOX_ERROR, "Sandbox error");

static const unordered_map<exit_status, const char *> status_name = boost::assign::map_list_of
    (exit_status::OK, "OK")
    (exit_status::TIMEOUT, "TIMEOUT")
    (exit_status::TIMEOUT_WALL, "TIMEOUT_WALL")
    (exit_status::SIGNAL, "SIGNAL")
    (exit_status::NONZERO_RETURN, "NONZERO_RETURN")
    (exit_status::SANDBOX_ERROR, "SANDBOX_ERROR");
// clang-format on

const char *get_display_message(exit_status stat) {
    return status_message.at(stat);
}

const char *get_status_name(exit_status stat) {
    return status_name.at(stat);
}

}  // namespace mjudge
