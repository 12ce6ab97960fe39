#include "judge/channel.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include <sys/stat.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

const char *const FIFO_MOUNT = "fifo";

scratch_directory::scratch_directory(const fs::path &root, const string &prefix, fs::perms perms) {
    try {
        dir = create_unique_directory(root, prefix, perms);
    } catch (exception &e) {
        throw sandbox_error(fmt::format("unable to create {} directory in {}: {}", prefix, root.string(), e.what()));
    }
}

const fs::path &scratch_directory::path() const {
    return dir;
}

void scratch_directory::release(bool success, bool keep) {
    if (!success || keep || KEEP_SANDBOX) {
        LOG(INFO) << "Keeping " << dir;
        return;
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(ERROR) << "Unable to remove " << dir << ": " << ec.message();
}

static void make_fifo(const fs::path &path) {
    if (mkfifo(path.c_str(), 0666) == -1)
        throw sandbox_error(fmt::format("unable to create fifo {}: {}", path.string(), strerror(errno)));
    // mkfifo 受 umask 影响
    if (chmod(path.c_str(), 0666) == -1)
        throw sandbox_error(fmt::format("unable to chmod fifo {}: {}", path.string(), strerror(errno)));
}

fifo_channel create_channel_pair(const fs::path &root) {
    scratch_directory dir(root, "fifo", fs::perms(0755));
    scoped_guard remove_dir([&] {
        std::error_code ec;
        fs::remove_all(dir.path(), ec);
    });

    fs::path user_to_manager = dir.path() / "u_to_m";
    fs::path manager_to_user = dir.path() / "m_to_u";
    make_fifo(user_to_manager);
    make_fifo(manager_to_user);

    remove_dir.dismiss();
    DLOG(INFO) << "Created channel pair in " << dir.path();
    return fifo_channel{dir, user_to_manager, manager_to_user};
}

}  // namespace mjudge
