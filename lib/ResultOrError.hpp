#ifndef PP_INDEXER_RESULT_OR_ERROR_HPP
#define PP_INDEXER_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace ppi {

/**
 * Common base for error types carried by ResultOrError.
 * Derived types add nothing but their own identity, e.g.
 *   struct Error : RoeErrorBase { using RoeErrorBase::RoeErrorBase; };
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

template<typename T, typename E = std::string>
class ResultOrError {
  static_assert(!std::is_same<T, E>::value, "value and error types must differ");

public:
    // Constructors for success case
    ResultOrError(const T& value) : hasValue_(true) {
        new (&storage_) T(value);
    }

    ResultOrError(T&& value) : hasValue_(true) {
        new (&storage_) T(std::move(value));
    }

    // Constructors for error case
    ResultOrError(const E& err) : hasValue_(false) {
        new (&storage_) E(err);
    }

    ResultOrError(E&& err) : hasValue_(false) {
        new (&storage_) E(std::move(err));
    }

    static ResultOrError error(const E& err) {
        return ResultOrError(err);
    }

    // Copy constructor
    ResultOrError(const ResultOrError& other) : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&storage_) T(*reinterpret_cast<const T*>(&other.storage_));
        } else {
            new (&storage_) E(*reinterpret_cast<const E*>(&other.storage_));
        }
    }

    // Move constructor
    ResultOrError(ResultOrError&& other) noexcept : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&storage_) T(std::move(*reinterpret_cast<T*>(&other.storage_)));
        } else {
            new (&storage_) E(std::move(*reinterpret_cast<E*>(&other.storage_)));
        }
    }

    ~ResultOrError() {
        destroy();
    }

    ResultOrError& operator=(const ResultOrError& other) {
        if (this != &other) {
            destroy();
            hasValue_ = other.hasValue_;
            if (hasValue_) {
                new (&storage_) T(*reinterpret_cast<const T*>(&other.storage_));
            } else {
                new (&storage_) E(*reinterpret_cast<const E*>(&other.storage_));
            }
        }
        return *this;
    }

    ResultOrError& operator=(ResultOrError&& other) noexcept {
        if (this != &other) {
            destroy();
            hasValue_ = other.hasValue_;
            if (hasValue_) {
                new (&storage_) T(std::move(*reinterpret_cast<T*>(&other.storage_)));
            } else {
                new (&storage_) E(std::move(*reinterpret_cast<E*>(&other.storage_)));
            }
        }
        return *this;
    }

    bool isOk() const { return hasValue_; }
    bool isError() const { return !hasValue_; }

    explicit operator bool() const { return hasValue_; }

    // Access value (throws if error)
    const T& value() const {
        if (!hasValue_) {
            throw std::runtime_error("Attempting to access value of error result");
        }
        return *reinterpret_cast<const T*>(&storage_);
    }

    T& value() {
        if (!hasValue_) {
            throw std::runtime_error("Attempting to access value of error result");
        }
        return *reinterpret_cast<T*>(&storage_);
    }

    T valueOr(const T& defaultValue) const {
        return hasValue_ ? value() : defaultValue;
    }

    // Access error (throws if value)
    const E& error() const {
        if (hasValue_) {
            throw std::runtime_error("Attempting to access error of success result");
        }
        return *reinterpret_cast<const E*>(&storage_);
    }

    E& error() {
        if (hasValue_) {
            throw std::runtime_error("Attempting to access error of success result");
        }
        return *reinterpret_cast<E*>(&storage_);
    }

    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

private:
    void destroy() {
        if (hasValue_) {
            reinterpret_cast<T*>(&storage_)->~T();
        } else {
            reinterpret_cast<E*>(&storage_)->~E();
        }
    }

    bool hasValue_;
    typename std::aligned_union<0, T, E>::type storage_;
};

// Specialization for void return type
template<typename E>
class ResultOrError<void, E> {
public:
    // Success
    ResultOrError() : hasValue_(true) {}

    // Error
    ResultOrError(const E& err) : hasValue_(false) {
        new (&storage_) E(err);
    }

    ResultOrError(E&& err) : hasValue_(false) {
        new (&storage_) E(std::move(err));
    }

    static ResultOrError error(const E& err) {
        return ResultOrError(err);
    }

    ResultOrError(const ResultOrError& other) : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&storage_) E(*reinterpret_cast<const E*>(&other.storage_));
        }
    }

    ResultOrError(ResultOrError&& other) noexcept : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&storage_) E(std::move(*reinterpret_cast<E*>(&other.storage_)));
        }
    }

    ResultOrError& operator=(const ResultOrError& other) {
        if (this != &other) {
            destroy();
            hasValue_ = other.hasValue_;
            if (!hasValue_) {
                new (&storage_) E(*reinterpret_cast<const E*>(&other.storage_));
            }
        }
        return *this;
    }

    ResultOrError& operator=(ResultOrError&& other) noexcept {
        if (this != &other) {
            destroy();
            hasValue_ = other.hasValue_;
            if (!hasValue_) {
                new (&storage_) E(std::move(*reinterpret_cast<E*>(&other.storage_)));
            }
        }
        return *this;
    }

    ~ResultOrError() {
        destroy();
    }

    bool isOk() const { return hasValue_; }
    bool isError() const { return !hasValue_; }
    explicit operator bool() const { return hasValue_; }

    const E& error() const {
        if (hasValue_) {
            throw std::runtime_error("Attempting to access error of success result");
        }
        return *reinterpret_cast<const E*>(&storage_);
    }

    E& error() {
        if (hasValue_) {
            throw std::runtime_error("Attempting to access error of success result");
        }
        return *reinterpret_cast<E*>(&storage_);
    }

private:
    void destroy() {
        if (!hasValue_) {
            reinterpret_cast<E*>(&storage_)->~E();
        }
    }

    bool hasValue_;
    typename std::aligned_union<0, E>::type storage_;
};

} // namespace ppi

#endif // PP_INDEXER_RESULT_OR_ERROR_HPP
