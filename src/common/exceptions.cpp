#include "judgebox/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace judgebox {
using namespace std;

judgebox_exception::judgebox_exception()
    : judgebox_exception("") {}

judgebox_exception::judgebox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judgebox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judgebox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

policy_error::policy_error()
    : judgebox_exception() {}

policy_error::policy_error(const string &message)
    : judgebox_exception(message) {}

isolation_error::isolation_error()
    : judgebox_exception() {}

isolation_error::isolation_error(const string &message)
    : judgebox_exception(message) {}

resource_setup_error::resource_setup_error()
    : judgebox_exception() {}

resource_setup_error::resource_setup_error(const string &message)
    : judgebox_exception(message) {}

trace_error::trace_error()
    : judgebox_exception() {}

trace_error::trace_error(const string &message)
    : judgebox_exception(message) {}

internal_error::internal_error()
    : judgebox_exception() {}

internal_error::internal_error(const string &message)
    : judgebox_exception(message) {}

}  // namespace judgebox
