#include "judge/outcome.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

const char *const SCORE_MULTIPLIER_FILENAME = "score_multiplier.txt";

bool is_manager_verdict(int exit_code) {
    return exit_code == E_ACCEPTED || exit_code == E_WRONG_ANSWER;
}

static double read_score_multiplier(const fs::path &path) {
    string content;
    try {
        content = boost::algorithm::trim_copy(read_file_content(path));
    } catch (system_error &e) {
        throw manager_error(fmt::format("unable to read {}: {}", SCORE_MULTIPLIER_FILENAME, e.what()));
    }
    double value;
    try {
        value = boost::lexical_cast<double>(content);
    } catch (boost::bad_lexical_cast &) {
        throw manager_error(fmt::format("{} is not a number: \"{}\"", SCORE_MULTIPLIER_FILENAME, content));
    }
    if (!isfinite(value) || value < 0 || value > 1)
        throw manager_error(fmt::format("{} is out of range [0, 1]: {}", SCORE_MULTIPLIER_FILENAME, content));
    return value;
}

manager_verdict extract_outcome(const execution_stats &stats, const fs::path &feedback_dir) {
    manager_verdict verdict;
    if (!is_manager_verdict(stats.exit_code))
        return verdict;

    if (stats.exit_code == E_WRONG_ANSWER) {
        verdict.outcome = 0.0;
        verdict.text = vector<string>{"wrong"};
        return verdict;
    }

    fs::path multiplier = feedback_dir / SCORE_MULTIPLIER_FILENAME;
    std::error_code ec;
    fs::file_status status = fs::symlink_status(multiplier, ec);
    if (ec && status.type() != fs::file_type::not_found)
        throw manager_error(fmt::format("unable to stat {}: {}", multiplier.string(), ec.message()));

    if (status.type() != fs::file_type::not_found) {
        // 符号链接可能指向宿主机上的文件，不跟随
        if (status.type() != fs::file_type::regular)
            throw manager_error(fmt::format("{} is not a regular file", SCORE_MULTIPLIER_FILENAME));
        double outcome = read_score_multiplier(multiplier);
        verdict.outcome = outcome;
        verdict.text = vector<string>{outcome > 0.0 && outcome < 1.0 ? "partial" : "success"};
    } else {
        verdict.outcome = 1.0;
        verdict.text = vector<string>{"success"};
    }
    return verdict;
}

outcome_record reduce_results(const sandbox_result &user, const sandbox_result &manager, bool only_execution, const fs::path &feedback_dir) {
    // 42 和 43 是 manager 约定的评测结果，虽然返回值非 0 也视为正常
    // 只要 manager 自己给出了结果，即使略微超出了时间限制也采纳
    bool manager_ok = manager.box_success && is_manager_verdict(manager.stats.exit_code);

    if (!user.box_success || !manager.box_success) {
        LOG(ERROR) << "Sandbox error, user: " << get_status_name(user.stats.status)
                   << ", manager: " << get_status_name(manager.stats.status);
        return outcome_record::failure();
    }

    if (!manager_ok) {
        LOG(ERROR) << "Manager malfunction: status " << get_status_name(manager.stats.status)
                   << ", exit code " << manager.stats.exit_code;
        return outcome_record::failure();
    }

    if (only_execution)
        return outcome_record(true, 0.0, vector<string>{"Execution completed successfully"}, user.stats);

    if (!user.evaluation_success) {
        LOG(WARNING) << "User program failed: " << get_status_name(user.stats.status);
        return outcome_record(true, 0.0, vector<string>{get_display_message(user.stats.status)}, user.stats);
    }

    manager_verdict verdict = extract_outcome(manager.stats, feedback_dir);
    return outcome_record(true, verdict.outcome, verdict.text, user.stats);
}

}  // namespace mjudge
