#ifndef STORE_ERRORS_HPP
#define STORE_ERRORS_HPP

#include <stdexcept>
#include <string>

// Rejected set input. Nothing was written, the store is unchanged.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

// A durable write (or opening the log) could not be completed.
// code() is the errno of the failing call, 0 when there was none.
class IOFailure : public std::runtime_error {
public:
    IOFailure(const std::string& what, int code)
        : std::runtime_error(what), errorCode(code) {}

    int code() const { return errorCode; }

private:
    int errorCode;
};

#endif // STORE_ERRORS_HPP
