#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "sandbox/runguard_sandbox.hpp"
#include "sandbox/unsafe_sandbox.hpp"

namespace mjudge {
using namespace std;
namespace fs = std::filesystem;

static const fs::perms box_perms = fs::perms::owner_all | fs::perms::group_all | fs::perms::others_all;
static const fs::perms root_perms = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec;

sandbox::sandbox(file_cacher &cacher, const string &name)
    : cacher(cacher), name(name) {
    try {
        root = create_unique_directory(TEMP_DIR, name, root_perms);
        box = root / "box";
        fs::create_directory(box);
        fs::permissions(box, box_perms, fs::perm_options::replace);
    } catch (exception &e) {
        throw sandbox_error(fmt::format("unable to create sandbox {}: {}", name, e.what()));
    }
    DLOG(INFO) << "Created sandbox " << root;
}

sandbox::~sandbox() {
    // forked_process 的析构函数会杀死并回收没有结束的进程
    process.reset();
}

const string &sandbox::get_name() const {
    return name;
}

const fs::path &sandbox::root_path() const {
    return root;
}

const fs::path &sandbox::box_path() const {
    return box;
}

fs::path sandbox::relative_path(const string &filename) const {
    return box / assert_safe_path(filename);
}

void sandbox::create_file(const string &filename, const string &content, bool executable) {
    fs::path path = relative_path(filename);
    try {
        write_file_content(path, content);
        fs::permissions(path, executable ? fs::perms(0755) : fs::perms(0644), fs::perm_options::replace);
    } catch (exception &e) {
        throw sandbox_error(fmt::format("unable to create {} in sandbox {}: {}", filename, name, e.what()));
    }
}

void sandbox::create_file_from_storage(const string &filename, const string &digest, bool executable) {
    fs::path path = relative_path(filename);
    cacher.get_file_to_path(digest, path);
    try {
        fs::permissions(path, executable ? fs::perms(0755) : fs::perms(0644), fs::perm_options::replace);
    } catch (fs::filesystem_error &e) {
        throw sandbox_error(fmt::format("unable to set permissions of {}: {}", filename, e.what()));
    }
}

string sandbox::get_file_to_storage(const string &filename, const string &description) {
    return cacher.put_file_from_path(relative_path(filename), description);
}

string sandbox::get_file_to_string(const string &filename, size_t max_size) const {
    ifstream fin(relative_path(filename), ios::binary);
    if (!fin) return "";
    string content(max_size, '\0');
    fin.read(content.data(), max_size);
    content.resize(fin.gcount());
    return content;
}

void sandbox::mount(const directory_mount &mount) {
    fs::path target = relative_path(mount.inside_path.string());
    std::error_code ec;
    if (fs::is_symlink(target, ec)) {
        if (fs::read_symlink(target) == mount.host_path) return;
        fs::remove(target);
    }
    fs::create_directory_symlink(mount.host_path, target);
    if (!mount.writable)
        DLOG(INFO) << "Mounting " << mount.host_path << " read-only is not enforced without chroot";
}

shared_ptr<process_handle> sandbox::start_process(const process_options &options) {
    if (process && !process->finished())
        throw sandbox_error("sandbox " + name + " already has a running process");

    for (auto &m : options.mounts) {
        try {
            mount(m);
        } catch (fs::filesystem_error &e) {
            throw sandbox_error(fmt::format("unable to mount {} into sandbox {}: {}", m.host_path.string(), name, e.what()));
        }
    }

    fs::path side_file = root / fmt::format("run{}", run_count++);
    process = do_start(options, side_file);
    return process;
}

sandbox_result sandbox::collect_result() const {
    if (!process)
        throw sandbox_error("no process has been started in sandbox " + name);
    if (!process->finished())
        throw sandbox_error("process in sandbox " + name + " has not been waited");

    sandbox_result result;
    result.stats = process->stats();
    result.box_success = result.stats.status != exit_status::SANDBOX_ERROR;
    result.evaluation_success = result.stats.status == exit_status::OK;
    return result;
}

sandbox_result sandbox::run(const process_options &options) {
    auto handle = start_process(options);
    wait_for_all({handle});
    return collect_result();
}

void sandbox::cleanup(bool remove) {
    if (process && !process->finished()) {
        LOG(WARNING) << "Sandbox " << name << " released with a running process";
        process->kill();
        wait_for_all({process});
    }
    if (!remove) {
        LOG(INFO) << "Sandbox " << name << " kept in " << root;
        return;
    }
    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec)
        LOG(ERROR) << "Unable to remove sandbox " << root << ": " << ec.message();
}

unique_ptr<sandbox> create_sandbox(file_cacher &cacher, const string &name) {
    if (SANDBOX_BACKEND == "runguard") {
        return make_unique<runguard_sandbox>(cacher, name);
    } else if (SANDBOX_BACKEND == "unsafe") {
        return make_unique<unsafe_sandbox>(cacher, name);
    } else {
        throw internal_error("unknown sandbox backend " + SANDBOX_BACKEND);
    }
}

void delete_sandbox(sandbox &box, bool success, bool keep) {
    box.cleanup(success && !keep && !KEEP_SANDBOX);
}

}  // namespace mjudge
