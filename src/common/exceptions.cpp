#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codejudge {
using namespace std;

codejudge_exception::codejudge_exception()
    : codejudge_exception("") {}

codejudge_exception::codejudge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *codejudge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const codejudge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : codejudge_exception() {}

internal_error::internal_error(const string &message)
    : codejudge_exception(message) {}

database_error::database_error()
    : codejudge_exception() {}

database_error::database_error(const string &message)
    : codejudge_exception(message) {}

not_found_error::not_found_error()
    : codejudge_exception() {}

not_found_error::not_found_error(const string &message)
    : codejudge_exception(message) {}

configuration_error::configuration_error()
    : codejudge_exception() {}

configuration_error::configuration_error(const string &message)
    : codejudge_exception(message) {}

}  // namespace codejudge
