// EditorError.hpp
#pragma once

#include <string>
#include <system_error>
#include <utility>
#include <variant>

// Failure of a file or dialog operation. Never fatal.
struct Error
{
    enum class Kind { DialogClosed, IOFailed };

    Kind kind;
    std::error_code code; // set for IOFailed
    std::string detail;   // backend message, may be empty

    static Error dialogClosed() { return {Kind::DialogClosed, {}, {}}; }
    static Error ioFailed(std::error_code ec, std::string detail = {}) { return {Kind::IOFailed, ec, std::move(detail)}; }
    static Error ioFailed(std::errc e) { return {Kind::IOFailed, std::make_error_code(e), {}}; }

    std::string describe() const;
};

bool operator==(const Error& a, const Error& b);
inline bool operator!=(const Error& a, const Error& b) { return !(a == b); }

template <typename T>
class Result
{
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<0>(data_); }
    T& value() { return std::get<0>(data_); }
    const Error& error() const { return std::get<1>(data_); }

private:
    std::variant<T, Error> data_;
};
