#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "env.hpp"
#include "judge/evaluation.hpp"
#include "judge/language.hpp"
#include "storage/file_cacher.hpp"
using namespace std;

static int print_result(const nlohmann::json &result, bool success) {
    cout << result.dump(4) << endl;
    return success ? EXIT_SUCCESS : mjudge::E_INTERNAL_ERROR;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("mjudge options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "compile, evaluate or put")
        ("file", po::value<string>(), "file to be stored by put")
        ("job", po::value<string>(), "JSON file of the compilation job or evaluation job")
        ("mode", po::value<string>()->default_value("interactive"), "evaluation mode, interactive or non-interactive")
        ("temp-dir", po::value<string>(), "set the directory to create sandboxes, fifos, feedback directories in. You can either pass it from environ TEMPDIR")
        ("storage-dir", po::value<string>(), "set the directory of the content-addressed file storage. You can either pass it from environ STORAGEDIR")
        ("languages", po::value<string>(), "load additional language descriptors from the JSON file")
        ("sandbox", po::value<string>(), "set the sandbox backend, runguard or unsafe. You can either pass it from environ SANDBOX")
        ("keep-sandbox", "do not delete sandboxes and temporary directories. You can either pass it from environ KEEPSANDBOX")
        ("trusted-time-limit", po::value<double>(), "set the time limit in seconds of the manager, default to 120")
        ("trusted-memory-limit", po::value<size_t>(), "set the memory limit in KiB of the manager, default to 4194304(4GB)")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("command", 1).add("file", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "mjudge: Evaluate submissions of Kattis-style tasks with a trusted manager" << endl
             << "Optional Environment Variables:" << endl
             << "\tRUNGUARD: location of runguard" << endl
             << "Usage: " << argv[0] << " compile --job <job.json>" << endl
             << "       " << argv[0] << " evaluate --job <job.json> [--mode interactive|non-interactive]" << endl
             << "       " << argv[0] << " put <file>" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "mjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        mjudge::DEBUG = true;
    }

    if (vm.count("temp-dir")) {
        mjudge::TEMP_DIR = filesystem::path(vm.at("temp-dir").as<string>());
    } else if (getenv("TEMPDIR")) {
        mjudge::TEMP_DIR = filesystem::path(getenv("TEMPDIR"));
    }
    filesystem::create_directories(mjudge::TEMP_DIR);
    CHECK(filesystem::is_directory(mjudge::TEMP_DIR))
        << "Temporary directory " << mjudge::TEMP_DIR << " does not exist";

    if (vm.count("storage-dir")) {
        mjudge::STORAGE_DIR = filesystem::path(vm.at("storage-dir").as<string>());
    } else if (getenv("STORAGEDIR")) {
        mjudge::STORAGE_DIR = filesystem::path(getenv("STORAGEDIR"));
    }

    if (vm.count("sandbox")) {
        mjudge::SANDBOX_BACKEND = vm.at("sandbox").as<string>();
    } else if (getenv("SANDBOX")) {
        mjudge::SANDBOX_BACKEND = getenv("SANDBOX");
    }
    CHECK(mjudge::SANDBOX_BACKEND == "runguard" || mjudge::SANDBOX_BACKEND == "unsafe")
        << "Unknown sandbox backend " << mjudge::SANDBOX_BACKEND;

    if (mjudge::SANDBOX_BACKEND == "runguard") {
        CHECK(getenv("RUNGUARD"))
            << "RUNGUARD environment variable should be specified. This env points out where the runguard executable locates in.";

        if (getuid() != 0) {
            cerr << "You should run this program in privileged mode" << endl;
            if (!mjudge::DEBUG) return EXIT_FAILURE;
        }
    }

    if (vm.count("keep-sandbox") || getenv("KEEPSANDBOX")) {
        mjudge::KEEP_SANDBOX = true;
    }

    if (vm.count("trusted-time-limit")) {
        mjudge::TRUSTED_SANDBOX_MAX_TIME = vm["trusted-time-limit"].as<double>();
    }

    if (vm.count("trusted-memory-limit")) {
        mjudge::TRUSTED_SANDBOX_MAX_MEMORY_KIB = vm["trusted-memory-limit"].as<size_t>();
    }

    if (vm.count("run-user")) {
        set_env("RUNUSER", vm["run-user"].as<string>());
    }

    if (vm.count("run-group")) {
        set_env("RUNGROUP", vm["run-group"].as<string>());
    }

    mjudge::put_error_codes();

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    mjudge::language_registry languages;
    if (vm.count("languages")) {
        filesystem::path languages_file(vm["languages"].as<string>());
        CHECK(filesystem::is_regular_file(languages_file))
            << "Language file " << languages_file << " does not exist";
        try {
            languages.load(languages_file);
        } catch (std::exception &e) {
            LOG(FATAL) << "Language file " << languages_file << " is malformed: " << e.what();
        }
    }

    mjudge::local_file_cacher cacher(mjudge::STORAGE_DIR);

    if (!vm.count("command")) {
        cerr << "No command specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }
    string command = vm["command"].as<string>();

    if (command == "put") {
        if (!vm.count("file")) {
            cerr << "put requires a file" << endl;
            return EXIT_FAILURE;
        }
        filesystem::path file(vm["file"].as<string>());
        try {
            cout << cacher.put_file_from_path(file, file.filename().string()) << endl;
        } catch (mjudge::judge_exception &e) {
            cerr << e.what() << endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (!vm.count("job")) {
        cerr << command << " requires --job" << endl;
        return EXIT_FAILURE;
    }

    nlohmann::json job;
    try {
        job = nlohmann::json::parse(mjudge::read_file_content(vm["job"].as<string>()));
    } catch (std::exception &e) {
        cerr << "Job file " << vm["job"].as<string>() << " is malformed: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    string mode = vm["mode"].as<string>();
    if (mode != "interactive" && mode != "non-interactive") {
        cerr << "Unknown evaluation mode " << mode << endl;
        return EXIT_FAILURE;
    }
    mjudge::kattis_task task(mode, cacher, languages);

    try {
        if (command == "compile") {
            auto result = task.compile(job.get<mjudge::compilation_job>());
            return print_result(result, result.success);
        } else if (command == "evaluate") {
            auto record = task.evaluate(job.get<mjudge::evaluation_job>());
            return print_result(record, record.success());
        }
    } catch (nlohmann::json::exception &e) {
        cerr << "Job file " << vm["job"].as<string>() << " is malformed: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    cerr << "Unknown command " << command << endl;
    return EXIT_FAILURE;
}
