#pragma once

#include <jb/codec.hpp>

#include <memory>
#include <utility>

namespace jb {

  // Value-semantic heap cell. Generated types refer to each other through
  // boxed<T>, which keeps recursive vocabularies finite in size. A
  // default-constructed box allocates nothing and reads as T{}.
  template <typename T>
  class boxed {
    std::unique_ptr<T> ptr_;

    static const T&
    empty_value() {
      static const T empty{};
      return empty;
    }

  public:
    boxed() = default;

    boxed(T value) : ptr_(std::make_unique<T>(std::move(value))) {}

    boxed(const boxed& other)
        : ptr_(other.ptr_ ? std::make_unique<T>(*other.ptr_) : nullptr) {}

    boxed(boxed&&) noexcept = default;

    boxed&
    operator=(const boxed& other) {
      if (this != &other)
        ptr_ = other.ptr_ ? std::make_unique<T>(*other.ptr_) : nullptr;
      return *this;
    }

    boxed&
    operator=(boxed&&) noexcept = default;

    ~boxed() = default;

    const T&
    get() const {
      return ptr_ ? *ptr_ : empty_value();
    }

    T&
    get() {
      if (!ptr_) ptr_ = std::make_unique<T>();
      return *ptr_;
    }

    const T&
    operator*() const {
      return get();
    }

    T&
    operator*() {
      return get();
    }

    const T*
    operator->() const {
      return &get();
    }

    T*
    operator->() {
      return &get();
    }

    friend bool
    operator==(const boxed& a, const boxed& b) {
      return a.get() == b.get();
    }
  };

  template <typename T>
  struct json_codec<boxed<T>> {
    static boxed<T>
    decode(const json_value& json) {
      return boxed<T>(jb::decode<T>(json));
    }

    static json_value
    encode(const boxed<T>& value) {
      return jb::encode(value.get());
    }
  };

} // namespace jb
