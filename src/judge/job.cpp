#include "judge/job.hpp"

namespace mjudge {
using namespace std;
using namespace nlohmann;

outcome_record::outcome_record(bool success, optional<double> outcome, optional<vector<string>> text, optional<execution_stats> stats)
    : success_(success), outcome_(move(outcome)), text_(move(text)), stats_(move(stats)) {}

outcome_record outcome_record::failure() {
    return outcome_record(false, nullopt, nullopt, nullopt);
}

bool outcome_record::success() const {
    return success_;
}

const optional<double> &outcome_record::outcome() const {
    return outcome_;
}

const optional<vector<string>> &outcome_record::text() const {
    return text_;
}

const optional<execution_stats> &outcome_record::stats() const {
    return stats_;
}

void to_json(json &j, const execution_stats &stats) {
    j = {{"execution_time", stats.execution_time},
         {"execution_wall_clock_time", stats.execution_wall_clock_time},
         {"execution_memory", stats.execution_memory},
         {"exit_status", get_status_name(stats.status)},
         {"exit_code", stats.exit_code},
         {"signal", stats.signal}};
}

void to_json(json &j, const executable &exe) {
    j = {{"filename", exe.filename}, {"digest", exe.digest}};
}

void from_json(const json &j, executable &exe) {
    j.at("filename").get_to(exe.filename);
    j.at("digest").get_to(exe.digest);
}

// 可执行文件以数组形式给出，按文件名索引
static map<string, executable> executables_from_json(const json &j) {
    map<string, executable> result;
    for (auto &item : j) {
        executable exe = item.get<executable>();
        result[exe.filename] = exe;
    }
    return result;
}

void from_json(const json &j, compilation_job &job) {
    j.at("language").get_to(job.language);
    j.at("files").get_to(job.files);
    if (j.count("keep_sandbox"))
        j.at("keep_sandbox").get_to(job.keep_sandbox);
    if (j.count("info"))
        j.at("info").get_to(job.info);
}

void to_json(json &j, const compilation_result &result) {
    j = {{"success", result.success},
         {"compilation_success", result.compilation_success},
         {"text", result.text}};
    if (result.stats)
        j["stats"] = *result.stats;
    else
        j["stats"] = nullptr;
    j["executables"] = json::array();
    for (auto &[filename, exe] : result.executables)
        j["executables"].push_back(exe);
}

void from_json(const json &j, evaluation_job &job) {
    j.at("language").get_to(job.language);
    j.at("time_limit").get_to(job.time_limit);
    j.at("memory_limit").get_to(job.memory_limit);
    j.at("input").get_to(job.input);
    j.at("output").get_to(job.output);
    job.executables = executables_from_json(j.at("executables"));
    job.managers = executables_from_json(j.at("managers"));
    if (j.count("only_execution"))
        j.at("only_execution").get_to(job.only_execution);
    if (j.count("keep_sandbox"))
        j.at("keep_sandbox").get_to(job.keep_sandbox);
    if (j.count("multithreaded_sandbox"))
        j.at("multithreaded_sandbox").get_to(job.multithreaded_sandbox);
    if (j.count("info"))
        j.at("info").get_to(job.info);
}

void to_json(json &j, const outcome_record &record) {
    j["success"] = record.success();
    if (record.outcome())
        j["outcome"] = *record.outcome();
    else
        j["outcome"] = nullptr;
    if (record.text())
        j["text"] = *record.text();
    else
        j["text"] = nullptr;
    if (record.stats())
        j["stats"] = *record.stats();
    else
        j["stats"] = nullptr;
}

}  // namespace mjudge
