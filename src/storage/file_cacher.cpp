#include "storage/file_cacher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/uuid/detail/sha1.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

string sha1_digest(const string &content) {
    boost::uuids::detail::sha1 sha1;
    sha1.process_bytes(content.data(), content.size());
    boost::uuids::detail::sha1::digest_type digest;
    sha1.get_digest(digest);
    // digest_type 在不同版本的 boost 中是 unsigned int[5] 或 unsigned char[20]，按大端逐字节输出
    constexpr size_t word_size = sizeof(digest[0]);
    string result;
    for (auto word : digest)
        for (size_t i = word_size; i-- > 0;)
            result += fmt::format("{:02x}", (static_cast<unsigned long long>(word) >> (8 * i)) & 0xff);
    return result;
}

local_file_cacher::local_file_cacher(const fs::path &dir) : dir(dir) {
    fs::create_directories(dir);
}

fs::path local_file_cacher::path_of(const string &digest) const {
    if (digest.empty() || digest.find('/') != string::npos || digest.find("..") != string::npos)
        throw storage_error("malformed digest " + digest);
    return dir / digest;
}

string local_file_cacher::put_file_from_path(const fs::path &path, const string &description) {
    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &e) {
        throw storage_error(fmt::format("unable to read {} for {}: {}", path.string(), description, e.what()));
    }
    return put_file_content(content, description);
}

string local_file_cacher::put_file_content(const string &content, const string &description) {
    string digest = sha1_digest(content);
    fs::path target = path_of(digest);
    if (fs::exists(target)) return digest;

    fs::path temp = dir / (digest + ".tmp." + to_string(getpid()));
    try {
        write_file_content(temp, content);
        fs::rename(temp, target);
    } catch (system_error &e) {
        std::error_code ec;
        fs::remove(temp, ec);
        throw storage_error(fmt::format("unable to store {}: {}", description, e.what()));
    }
    DLOG(INFO) << "Stored " << description << " as " << digest;
    return digest;
}

void local_file_cacher::get_file_to_path(const string &digest, const fs::path &path) {
    fs::path source = path_of(digest);
    if (!fs::is_regular_file(source))
        throw storage_error("file with digest " + digest + " not found");
    try {
        fs::copy_file(source, path, fs::copy_options::overwrite_existing);
    } catch (fs::filesystem_error &e) {
        throw storage_error(fmt::format("unable to copy {} to {}: {}", digest, path.string(), e.what()));
    }
}

string local_file_cacher::get_file_content(const string &digest) {
    fs::path source = path_of(digest);
    if (!fs::is_regular_file(source))
        throw storage_error("file with digest " + digest + " not found");
    return read_file_content(source);
}

bool local_file_cacher::exists(const string &digest) {
    return fs::is_regular_file(path_of(digest));
}

}  // namespace mjudge
