#ifndef ISOFETCH_UTILS_RESULT_HPP_
#define ISOFETCH_UTILS_RESULT_HPP_

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace isofetch {
namespace utils {

// Wraps an error so Result<T, E> stays constructible when T and E coincide.
template <typename E>
struct Unexpected {
  E error;
};

template <typename E>
Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>{std::forward<E>(error)};
}

struct Ok {};

/**
 * @brief Value-or-error return type for operations whose failures are
 * expected at runtime (network, filesystem, subprocess).
 */
template <typename T, typename E>
class Result {
 public:
  Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
  Result(Unexpected<E> error)
      : storage_(std::in_place_index<1>, std::move(error.error)) {}

  bool hasValue() const { return storage_.index() == 0; }
  explicit operator bool() const { return hasValue(); }

  const T& value() const {
    if (!hasValue()) throw std::logic_error("Result holds an error");
    return std::get<0>(storage_);
  }
  T& value() {
    if (!hasValue()) throw std::logic_error("Result holds an error");
    return std::get<0>(storage_);
  }

  const E& error() const {
    if (hasValue()) throw std::logic_error("Result holds a value");
    return std::get<1>(storage_);
  }

 private:
  std::variant<T, E> storage_;
};

}  // namespace utils
}  // namespace isofetch

#endif  // ISOFETCH_UTILS_RESULT_HPP_
