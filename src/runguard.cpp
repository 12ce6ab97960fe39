#include "runguard.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace mjudge {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t end = 0;
        while (end + 1 < line.length()) {
            if (line[end] == ':' && line[end + 1] == ' ')
                break;
            ++end;
        }
        if (end + 2 > line.length()) continue;
        string key = line.substr(0, end);
        string value = end + 2 == line.length() ? "" : line.substr(end + 2);
        mp[key] = value;
    }
    return mp;
}

template <typename T>
bool try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return false;
    try {
        value = boost::lexical_cast<T>(it->second);
        return true;
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    result.valid = try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    if (metadata.count("time-result")) result.time_result = metadata.at("time-result");
    if (metadata.count("internal-error")) result.internal_error = metadata.at("internal-error");
    return result;
}

}  // namespace mjudge
