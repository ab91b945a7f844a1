
#ifndef DIRMIRROR_RESULT_H
#define DIRMIRROR_RESULT_H

#include "dirmirror/error.h"
#include <variant>
#include <type_traits>

namespace dirmirror {

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const {
        return std::get<T>(data_);
    }

    T& value() {
        return std::get<T>(data_);
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() : error_(ErrorCode::Success) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return error_.ok(); }
    const Error& error() const { return error_; }

private:
    Error error_;
};

}

#endif
