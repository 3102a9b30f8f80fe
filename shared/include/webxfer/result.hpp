#pragma once

#include "error.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace webxfer {

struct Ok {};

template <typename T = Ok, typename E = Error>
class Result {
    std::variant<T, E> value;

public:
    Result(T v) : value(std::in_place_index<0>, std::move(v)) {}
    Result(E e) : value(std::in_place_index<1>, std::move(e)) {}

    static Result ok(T v) { return Result(std::move(v)); }
    static Result err(E e) { return Result(std::move(e)); }

    bool is_ok() const { return this->value.index() == 0; }
    bool is_err() const { return this->value.index() == 1; }

    const T &unwrap() const {
        if (this->is_err()) {
            throw std::runtime_error("result_unwrap: unwrap called on error value");
        }
        return std::get<0>(this->value);
    }

    T &unwrap() {
        if (this->is_err()) {
            throw std::runtime_error("result_unwrap: unwrap called on error value");
        }
        return std::get<0>(this->value);
    }

    const E &error() const {
        if (this->is_ok()) {
            throw std::logic_error("result_error: error called on success value");
        }
        return std::get<1>(this->value);
    }
};

using EmptyResult = Result<Ok>;

}
