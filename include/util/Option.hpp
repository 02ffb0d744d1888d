#pragma once

#include <cstddef>
#include <new>
#include <stdexcept>

namespace markdownd {

/**
 * Thrown by Option::Unwrap() on an empty Option.
 */
class BadOptionAccess : public std::runtime_error {
 public:
  explicit BadOptionAccess(const char* msg) : std::runtime_error(msg) {}
};

/**
 * Option<T> - a value that may be absent.
 *
 * Used by the request path for lookups that either yield a value or do not
 * (resolved paths, sibling lookups, parsed headers). The value lives in
 * in-place storage; no heap allocation happens for the Option itself.
 */
template <typename T>
class Option {
 private:
  union Storage {
    char dummy;
    struct {
      char data[sizeof(T)];
      double aligner;
    } aligned;
  } m_storage;

  bool m_hasValue;

  T* GetPtr() { return reinterpret_cast<T*>(&m_storage.aligned.data[0]); }
  const T* GetPtr() const {
    return reinterpret_cast<const T*>(&m_storage.aligned.data[0]);
  }

 public:
  Option() : m_hasValue(false) {}

  explicit Option(const T& value) : m_hasValue(true) {
    new (GetPtr()) T(value);
  }

  Option(const Option& other) : m_hasValue(other.m_hasValue) {
    if (m_hasValue) new (GetPtr()) T(*other.GetPtr());
  }

  Option& operator=(const Option& other) {
    if (this != &other) {
      Reset();
      if (other.m_hasValue) {
        new (GetPtr()) T(*other.GetPtr());
        m_hasValue = true;
      }
    }
    return *this;
  }

  ~Option() { Reset(); }

  static Option None() { return Option(); }
  static Option Some(const T& value) { return Option(value); }

  bool IsSome() const { return m_hasValue; }
  bool IsNone() const { return !m_hasValue; }

  /**
   * Access the contained value.
   * @throws BadOptionAccess if the Option is empty
   */
  T& Unwrap() {
    if (!m_hasValue) throw BadOptionAccess("Called Unwrap() on empty Option");
    return *GetPtr();
  }
  const T& Unwrap() const {
    if (!m_hasValue) throw BadOptionAccess("Called Unwrap() on empty Option");
    return *GetPtr();
  }

  // Pointer to the value, or NULL when empty.
  T* Get() { return m_hasValue ? GetPtr() : NULL; }
  const T* Get() const { return m_hasValue ? GetPtr() : NULL; }

  T UnwrapOr(const T& fallback) const {
    return m_hasValue ? *GetPtr() : fallback;
  }

  void Reset() {
    if (m_hasValue) {
      GetPtr()->~T();
      m_hasValue = false;
    }
  }
};

}  // namespace markdownd
