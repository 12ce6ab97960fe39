#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace mjudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

sandbox_error::sandbox_error()
    : judge_exception() {}

sandbox_error::sandbox_error(const string &message)
    : judge_exception(message) {}

manager_error::manager_error()
    : judge_exception() {}

manager_error::manager_error(const string &message)
    : judge_exception(message) {}

storage_error::storage_error()
    : judge_exception() {}

storage_error::storage_error(const string &message)
    : judge_exception(message) {}

}  // namespace mjudge
