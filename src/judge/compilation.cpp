#include "judge/compilation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace mjudge {
using namespace std;

static const char *COMPILER_STDOUT = "compiler_stdout.txt";
static const char *COMPILER_STDERR = "compiler_stderr.txt";

string executable_filename(const vector<string> &codenames, const language &lang) {
    vector<string> names;
    for (auto &codename : codenames)
        names.push_back(boost::algorithm::replace_all_copy(codename, ".%l", ""));
    sort(names.begin(), names.end());
    return boost::algorithm::join(names, "_") + lang.executable_extension;
}

static string describe_failure(const execution_stats &stats) {
    switch (stats.status) {
        case exit_status::TIMEOUT:
        case exit_status::TIMEOUT_WALL:
            return "Compilation timed out";
        case exit_status::SIGNAL:
            return fmt::format("Compilation killed with signal {}", stats.signal);
        default:
            return "Compilation failed";
    }
}

compilation_result compile(const compilation_job &job, const language &lang, file_cacher &cacher, const sandbox_factory &factory) {
    compilation_result result;
    if (job.files.empty()) {
        LOG(ERROR) << "Submission " << job.info << " contains no files";
        return result;
    }

    vector<string> codenames, sources;
    for (auto &[codename, digest] : job.files) {
        codenames.push_back(codename);
        sources.push_back(boost::algorithm::replace_all_copy(codename, ".%l", lang.source_extension));
    }
    string executable = executable_filename(codenames, lang);
    auto commands = lang.get_compilation_commands(sources, executable);

    auto box = factory(cacher, "compile");
    size_t i = 0;
    for (auto &[codename, digest] : job.files)
        box->create_file_from_storage(sources[i++], digest);

    result.success = true;
    result.compilation_success = true;
    for (auto &command : commands) {
        process_options options;
        options.command = command;
        options.time_limit = COMPILATION_MAX_TIME;
        options.wall_time_limit = 2 * COMPILATION_MAX_TIME + 1;
        options.memory_limit = COMPILATION_MAX_MEMORY_KIB * 1024;
        options.stdout_redirect = COMPILER_STDOUT;
        options.stderr_redirect = COMPILER_STDERR;
        options.multiprocess = true;

        sandbox_result step = box->run(options);
        result.stats = step.stats;
        if (!step.box_success) {
            LOG(ERROR) << "Sandbox error while compiling " << job.info;
            result.success = false;
            result.compilation_success = false;
            break;
        }
        if (!step.evaluation_success) {
            result.compilation_success = false;
            break;
        }
    }

    if (result.success) {
        if (result.compilation_success) {
            result.text.push_back("Compilation succeeded");
            string digest = box->get_file_to_storage(executable, fmt::format("Executable {} for {}", executable, job.info));
            result.executables[executable] = {executable, digest};
        } else {
            result.text.push_back(describe_failure(*result.stats));
        }
        string output = box->get_file_to_string(COMPILER_STDOUT) + box->get_file_to_string(COMPILER_STDERR);
        if (!output.empty())
            result.text.push_back(output);
    }
    LOG(INFO) << "Compilation of " << job.info << " finished: " << (result.compilation_success ? "succeeded" : "failed");

    delete_sandbox(*box, result.success, job.keep_sandbox);
    return result;
}

}  // namespace mjudge
