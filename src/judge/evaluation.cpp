#include "judge/evaluation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/channel.hpp"
#include "judge/compilation.hpp"
#include "judge/outcome.hpp"

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

const char *const MANAGER_FILENAME = "manager";
const char *const INPUT_FILENAME = "input.txt";
const char *const ANSWER_FILENAME = "answer.txt";

static const char *FEEDBACK_MOUNT = "feedback";
static const char *OUTPUT_MOUNT = "output";
static const char *OUTPUT_FILENAME = "output/output.txt";

// clang-format off
static const unordered_map<interactive_state, const char *> state_name = boost::assign::map_list_of
    (interactive_state::INIT, "INIT")
    (interactive_state::CHANNELS_READY, "CHANNELS_READY")
    (interactive_state::MANAGER_STARTED, "MANAGER_STARTED")
    (interactive_state::USER_STARTED, "USER_STARTED")
    (interactive_state::BOTH_RUNNING, "BOTH_RUNNING")
    (interactive_state::COLLECTED, "COLLECTED")
    (interactive_state::CLEANED_UP, "CLEANED_UP");
// clang-format on

const char *get_state_name(interactive_state state) {
    return state_name.at(state);
}

static void advance(interactive_state &state, interactive_state next, const evaluation_job &job) {
    DLOG(INFO) << job.info << ": " << get_state_name(state) << " -> " << get_state_name(next);
    state = next;
}

/**
 * @brief manager 需要等待选手程序，因此时间限制至少为选手程序的时间限制加一秒
 */
static double manager_time_limit(const evaluation_job &job) {
    return max(job.time_limit + 1.0, TRUSTED_SANDBOX_MAX_TIME);
}

static unique_ptr<sandbox> prepare_manager_sandbox(const evaluation_job &job, const evaluation_context &context) {
    auto box = context.factory(context.cacher, "manager_evaluate");
    box->create_file_from_storage(MANAGER_FILENAME, job.managers.at(MANAGER_FILENAME).digest, true);
    box->create_file_from_storage(INPUT_FILENAME, job.input);
    box->create_file_from_storage(ANSWER_FILENAME, job.output);
    return box;
}

static process_options manager_options(const evaluation_job &job) {
    process_options options;
    options.command = {fmt::format("./{}", MANAGER_FILENAME), INPUT_FILENAME, ANSWER_FILENAME, FEEDBACK_MOUNT};
    options.time_limit = manager_time_limit(job);
    options.wall_time_limit = manager_time_limit(job);
    options.memory_limit = TRUSTED_SANDBOX_MAX_MEMORY_KIB * 1024;
    options.multiprocess = job.multithreaded_sandbox;
    return options;
}

static process_options user_options(const evaluation_job &job, const vector<string> &command) {
    process_options options;
    options.command = command;
    options.time_limit = job.time_limit;
    options.wall_time_limit = 2 * job.time_limit + 1;
    options.memory_limit = job.memory_limit;
    options.multiprocess = job.multithreaded_sandbox;
    return options;
}

/**
 * @brief 创建选手沙箱，放入可执行文件并执行运行前的准备命令
 * @return 选手沙箱和运行选手程序的命令
 */
static pair<unique_ptr<sandbox>, vector<string>> prepare_user_sandbox(const evaluation_job &job, const evaluation_context &context) {
    auto &[filename, exe] = *job.executables.begin();
    auto box = context.factory(context.cacher, "user_evaluate");
    box->create_file_from_storage(filename, exe.digest, true);

    string main = fs::path(filename).stem().string();
    auto commands = context.lang.get_evaluation_commands(filename, main);
    if (commands.empty())
        throw internal_error("language " + context.lang.name + " has no evaluation command");

    for (size_t i = 0; i + 1 < commands.size(); ++i) {
        process_options options;
        options.command = commands[i];
        options.time_limit = TRUSTED_SANDBOX_MAX_TIME;
        options.wall_time_limit = TRUSTED_SANDBOX_MAX_TIME;
        options.memory_limit = TRUSTED_SANDBOX_MAX_MEMORY_KIB * 1024;
        options.multiprocess = true;
        sandbox_result result = box->run(options);
        if (!result.box_success || !result.evaluation_success)
            throw sandbox_error(fmt::format("setup command {} failed: {}", commands[i][0], get_status_name(result.stats.status)));
    }
    return {move(box), commands.back()};
}

outcome_record interactive_evaluation::evaluate(const evaluation_job &job, const evaluation_context &context) const {
    interactive_state state = interactive_state::INIT;

    fifo_channel channel = create_channel_pair(TEMP_DIR);
    scratch_directory feedback(TEMP_DIR, "feedback", fs::perms(0777));
    advance(state, interactive_state::CHANNELS_READY, job);

    auto manager_box = prepare_manager_sandbox(job, context);
    auto [user_box, user_command] = prepare_user_sandbox(job, context);

    fs::path user_to_manager = fs::path(FIFO_MOUNT) / channel.user_to_manager.filename();
    fs::path manager_to_user = fs::path(FIFO_MOUNT) / channel.manager_to_user.filename();

    process_options manager = manager_options(job);
    manager.mounts = {{channel.dir.path(), FIFO_MOUNT, true}, {feedback.path(), FEEDBACK_MOUNT, true}};
    manager.stdin_redirect = user_to_manager;
    manager.stdout_redirect = manager_to_user;
    manager.order = redirect_order::STDIN_FIRST;
    auto manager_process = manager_box->start_process(manager);
    advance(state, interactive_state::MANAGER_STARTED, job);

    process_options user = user_options(job, user_command);
    user.mounts = {{channel.dir.path(), FIFO_MOUNT, true}};
    user.stdin_redirect = manager_to_user;
    user.stdout_redirect = user_to_manager;
    user.order = redirect_order::STDOUT_FIRST;
    auto user_process = user_box->start_process(user);
    advance(state, interactive_state::USER_STARTED, job);

    advance(state, interactive_state::BOTH_RUNNING, job);
    wait_for_all({manager_process, user_process});

    sandbox_result user_result = user_box->collect_result();
    sandbox_result manager_result = manager_box->collect_result();
    outcome_record record = reduce_results(user_result, manager_result, job.only_execution, feedback.path());
    advance(state, interactive_state::COLLECTED, job);

    delete_sandbox(*manager_box, record.success(), job.keep_sandbox);
    delete_sandbox(*user_box, record.success(), job.keep_sandbox);
    channel.dir.release(record.success(), job.keep_sandbox);
    feedback.release(record.success(), job.keep_sandbox);
    advance(state, interactive_state::CLEANED_UP, job);
    return record;
}

outcome_record noninteractive_evaluation::evaluate(const evaluation_job &job, const evaluation_context &context) const {
    scratch_directory output(TEMP_DIR, "output", fs::perms(0777));

    auto [user_box, user_command] = prepare_user_sandbox(job, context);
    user_box->create_file_from_storage(INPUT_FILENAME, job.input);

    process_options user = user_options(job, user_command);
    user.mounts = {{output.path(), OUTPUT_MOUNT, true}};
    user.stdin_redirect = INPUT_FILENAME;
    user.stdout_redirect = OUTPUT_FILENAME;
    auto user_process = user_box->start_process(user);
    wait_for_all({user_process});
    DLOG(INFO) << job.info << ": user program finished, starting manager";

    // manager 只在选手程序结束之后启动
    scratch_directory feedback(TEMP_DIR, "feedback", fs::perms(0777));
    auto manager_box = prepare_manager_sandbox(job, context);
    process_options manager = manager_options(job);
    manager.mounts = {{output.path(), OUTPUT_MOUNT, true}, {feedback.path(), FEEDBACK_MOUNT, true}};
    manager.stdin_redirect = OUTPUT_FILENAME;
    manager_box->run(manager);

    sandbox_result user_result = user_box->collect_result();
    sandbox_result manager_result = manager_box->collect_result();
    outcome_record record = reduce_results(user_result, manager_result, job.only_execution, feedback.path());

    delete_sandbox(*manager_box, record.success(), job.keep_sandbox);
    delete_sandbox(*user_box, record.success(), job.keep_sandbox);
    output.release(record.success(), job.keep_sandbox);
    feedback.release(record.success(), job.keep_sandbox);
    return record;
}

evaluation_mode make_evaluation_mode(const string &parameter) {
    if (parameter == "interactive")
        return interactive_evaluation();
    else if (parameter == "non-interactive")
        return noninteractive_evaluation();
    else
        throw invalid_argument("unknown evaluation mode " + parameter);
}

kattis_task::kattis_task(const string &parameter, file_cacher &cacher, const language_registry &languages, sandbox_factory factory)
    : mode(make_evaluation_mode(parameter)), cacher(cacher), languages(languages), factory(move(factory)) {}

const char *kattis_task::name() const {
    return "Kattis";
}

bool kattis_task::is_interactive() const {
    return holds_alternative<interactive_evaluation>(mode);
}

compilation_result kattis_task::compile(const compilation_job &job) const {
    try {
        return mjudge::compile(job, languages.get(job.language), cacher, factory);
    } catch (judge_exception &e) {
        LOG(ERROR) << "Compilation of " << job.info << " failed: " << e;
        return compilation_result();
    } catch (exception &e) {
        LOG(ERROR) << "Compilation of " << job.info << " failed with an infrastructure fault: " << e.what();
        return compilation_result();
    }
}

outcome_record kattis_task::evaluate(const evaluation_job &job) const {
    if (job.executables.size() != 1) {
        LOG(ERROR) << "Submission " << job.info << " contains " << job.executables.size() << " executables, expected 1";
        return outcome_record::failure();
    }
    if (!job.managers.count(MANAGER_FILENAME)) {
        LOG(ERROR) << "Task of " << job.info << " has no manager";
        return outcome_record::failure();
    }

    try {
        evaluation_context context{cacher, factory, languages.get(job.language)};
        outcome_record record = visit([&](auto &evaluation) { return evaluation.evaluate(job, context); }, mode);
        LOG(INFO) << "Evaluated " << job.info << ": success " << record.success()
                  << ", outcome " << (record.outcome() ? fmt::format("{}", *record.outcome()) : "null");
        return record;
    } catch (manager_error &e) {
        LOG(ERROR) << "Manager malfunction while evaluating " << job.info << ": " << e.what();
        return outcome_record::failure();
    } catch (judge_exception &e) {
        LOG(ERROR) << "Evaluation of " << job.info << " aborted: " << e;
        return outcome_record::failure();
    } catch (exception &e) {
        LOG(ERROR) << "Evaluation of " << job.info << " aborted by an infrastructure fault: " << e.what();
        return outcome_record::failure();
    }
}

}  // namespace mjudge
