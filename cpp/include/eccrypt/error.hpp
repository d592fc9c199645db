#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace eccrypt {

enum class ErrorKind {
    kInvalidKey,     // malformed or out-of-range key material
    kEncoding,       // a derived value does not fit its fixed-width field
    kMacMismatch,    // integrity check failed, nothing was decrypted
    kCipherFailure,  // block cipher or padding failure after a passing MAC
    kInvalidInput,   // malformed signature, public key or wire field
    kInternal,       // an OpenSSL call failed for reasons unrelated to the input
};

const char* ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

[[noreturn]] void Throw(ErrorKind kind, const std::string& message);

// Value or Error. Facade operations return this so a caller cannot let a
// decryption or verification failure pass unnoticed.
template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& {
        if (!ok()) {
            throw std::get<1>(state_);
        }
        return std::get<0>(state_);
    }

    T value() && {
        if (!ok()) {
            throw std::get<1>(state_);
        }
        return std::get<0>(std::move(state_));
    }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<1>(state_);
    }

private:
    std::variant<T, Error> state_;
};

// Runs fn and folds an eccrypt::Error into the Result. Other runtime
// errors (failed OpenSSL calls) become kInternal; std::bad_alloc and logic
// errors propagate.
template <typename Fn>
auto Capture(Fn&& fn) -> Result<decltype(fn())> {
    try {
        return Result<decltype(fn())>(fn());
    } catch (const Error& err) {
        return Result<decltype(fn())>(err);
    } catch (const std::runtime_error& err) {
        return Result<decltype(fn())>(Error(ErrorKind::kInternal, err.what()));
    }
}

}  // namespace eccrypt
