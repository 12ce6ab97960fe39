#include "common/io_utils.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include "common/exceptions.hpp"

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
    fout << content;
}

string assert_safe_path(const string &subpath) {
    fs::path path(subpath);
    if (subpath.empty() || path.is_absolute())
        throw sandbox_error("subpath is not safe " + subpath);
    for (auto &component : path)
        if (component == "..")
            throw sandbox_error("subpath is not safe " + subpath);
    return subpath;
}

fs::path create_unique_directory(const fs::path &root, const string &prefix, fs::perms perms) {
    fs::create_directories(root);
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path dir = root / (prefix + "-" + uuid);
    if (!fs::create_directory(dir))
        throw runtime_error("directory already exists " + dir.string());
    fs::permissions(dir, perms, fs::perm_options::replace);
    return dir;
}

}  // namespace mjudge
