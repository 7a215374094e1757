#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arbiter {
using namespace std;

arbiter_exception::arbiter_exception()
    : arbiter_exception("") {}

arbiter_exception::arbiter_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *arbiter_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const arbiter_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

unsupported_language::unsupported_language(const string &language)
    : arbiter_exception("Unsupported language " + language), language(language) {}

executor_unreachable::executor_unreachable()
    : arbiter_exception() {}

executor_unreachable::executor_unreachable(const string &message)
    : arbiter_exception(message) {}

executor_protocol_error::executor_protocol_error()
    : arbiter_exception() {}

executor_protocol_error::executor_protocol_error(const string &message)
    : arbiter_exception(message) {}

database_error::database_error()
    : arbiter_exception() {}

database_error::database_error(const string &message)
    : arbiter_exception(message) {}

orchestrator_error::orchestrator_error()
    : arbiter_exception() {}

orchestrator_error::orchestrator_error(const string &message)
    : arbiter_exception(message) {}

invalid_submission::invalid_submission()
    : arbiter_exception() {}

invalid_submission::invalid_submission(const string &message)
    : arbiter_exception(message) {}

already_judging::already_judging(const string &sub_id)
    : arbiter_exception("Submission " + sub_id + " is being judged by another worker") {}

}  // namespace arbiter
