#include "test/mock_sandbox.hpp"

namespace mjudge::mock {
using namespace std;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

fake_process::fake_process(const execution_stats &stats) {
    result = stats;
}

bool fake_process::try_wait() {
    done = true;
    return true;
}

void fake_process::kill() {}

shared_ptr<fake_process> fake_process::exited(int exit_code) {
    execution_stats stats;
    stats.exit_code = exit_code;
    stats.status = exit_code == 0 ? exit_status::OK : exit_status::NONZERO_RETURN;
    return make_shared<fake_process>(stats);
}

shared_ptr<fake_process> fake_process::with_status(exit_status status) {
    execution_stats stats;
    stats.status = status;
    if (status == exit_status::SIGNAL) {
        stats.signal = 9;
        stats.exit_code = 137;
    }
    return make_shared<fake_process>(stats);
}

sandbox_factory mock_sandbox_factory::factory() {
    return [this](file_cacher &cacher, const string &name) -> unique_ptr<sandbox> {
        auto box = make_unique<NiceMock<mock_sandbox>>(cacher, name);
        mock_sandbox *raw = box.get();
        created.push_back(box->root_path());
        ON_CALL(*box, do_start(_, _))
            .WillByDefault(Invoke([this, raw](const process_options &options, const filesystem::path &) {
                started.push_back({raw->get_name(), options, raw->box_path()});
                return on_start(*raw, options);
            }));
        return box;
    };
}

}  // namespace mjudge::mock
