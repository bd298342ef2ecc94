#pragma once
#include <string>
#include <utility>
#include <variant>

namespace switchyard {
namespace utils {

// Holds either a value of type T or an error message.
// Move-only value types (e.g. std::unique_ptr) are supported.

template <typename T>
class Result {
public:
    // Success
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    // Error
    Result(const std::string& error) : data_(std::in_place_index<1>, error) {}
    Result(std::string&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const { return data_.index() == 0; }
    bool has_error() const { return data_.index() == 1; }
    explicit operator bool() const { return has_value(); }

    const T& value() const & { return std::get<0>(data_); }
    T& value() & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }
    const std::string& error() const { return std::get<1>(data_); }

private:
    std::variant<T, std::string> data_;
};

template <>
class Result<void> {
public:
    Result() : success_(true) {}
    Result(const std::string& error) : success_(false), error_(error) {}
    Result(std::string&& error) : success_(false), error_(std::move(error)) {}

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    explicit operator bool() const { return success_; }
    const std::string& error() const { return error_; }

private:
    bool success_ = false;
    std::string error_;
};

} // namespace utils

using utils::Result;

} // namespace switchyard
