#include "env.hpp"
#include <string>
#include "common/utils.hpp"
#include "config.hpp"

namespace mjudge {
using namespace std;

void put_error_codes() {
    set_env("E_SUCCESS", to_string(mjudge::error_codes::E_SUCCESS));
    set_env("E_INTERNAL_ERROR", to_string(mjudge::error_codes::E_INTERNAL_ERROR));
    set_env("E_ACCEPTED", to_string(mjudge::error_codes::E_ACCEPTED));
    set_env("E_WRONG_ANSWER", to_string(mjudge::error_codes::E_WRONG_ANSWER));
    set_env("E_COMPILER_ERROR", to_string(mjudge::error_codes::E_COMPILER_ERROR));
}

}  // namespace mjudge
