#include "judge/language.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace mjudge {
using namespace std;
using namespace nlohmann;

static vector<vector<string>> expand(const vector<vector<string>> &templates, const vector<string> &sources, const string &executable, const string &main) {
    vector<vector<string>> commands;
    for (auto &command_template : templates) {
        vector<string> command;
        for (auto &arg : command_template) {
            if (arg == "{sources}") {
                command.insert(command.end(), sources.begin(), sources.end());
                continue;
            }
            string expanded = boost::algorithm::replace_all_copy(arg, "{executable}", executable);
            boost::algorithm::replace_all(expanded, "{main}", main);
            command.push_back(expanded);
        }
        commands.push_back(command);
    }
    return commands;
}

vector<vector<string>> language::get_compilation_commands(const vector<string> &source_filenames, const string &executable_filename) const {
    string main = executable_filename.substr(0, executable_filename.size() - executable_extension.size());
    return expand(compile, source_filenames, executable_filename, main);
}

vector<vector<string>> language::get_evaluation_commands(const string &executable_filename, const string &main) const {
    return expand(evaluate, {}, executable_filename, main);
}

void from_json(const json &j, language &lang) {
    j.at("name").get_to(lang.name);
    j.at("source_extension").get_to(lang.source_extension);
    if (j.count("executable_extension"))
        j.at("executable_extension").get_to(lang.executable_extension);
    else
        lang.executable_extension = "";
    j.at("compile").get_to(lang.compile);
    j.at("evaluate").get_to(lang.evaluate);
}

language_registry::language_registry() {
    add({"C11 / gcc", ".c", "",
         {{"/usr/bin/gcc", "-DEVAL", "-std=gnu11", "-O2", "-pipe", "-static", "-s", "-o", "{executable}", "{sources}", "-lm"}},
         {{"./{executable}"}}});
    add({"C++17 / g++", ".cpp", "",
         {{"/usr/bin/g++", "-DEVAL", "-std=gnu++17", "-O2", "-pipe", "-static", "-s", "-o", "{executable}", "{sources}"}},
         {{"./{executable}"}}});
    add({"Bash", ".sh", "",
         {{"/bin/cp", "{sources}", "{executable}"}},
         {{"/bin/bash", "{executable}"}}});
}

void language_registry::load(const filesystem::path &path) {
    json j = json::parse(read_file_content(path));
    for (auto &item : j) {
        language lang = item.get<language>();
        LOG(INFO) << "Loaded language " << lang.name << " from " << path;
        add(lang);
    }
}

void language_registry::add(const language &lang) {
    languages[lang.name] = lang;
}

const language &language_registry::get(const string &name) const {
    auto it = languages.find(name);
    if (it == languages.end())
        throw internal_error("unknown language " + name);
    return it->second;
}

bool language_registry::contains(const string &name) const {
    return languages.count(name) > 0;
}

}  // namespace mjudge
