#pragma once

#include <cstddef>
#include <new>
#include <stdexcept>

namespace markdownd {

/**
 * Thrown when the wrong side of a Result is unwrapped.
 */
class BadResultAccess : public std::runtime_error {
 public:
  explicit BadResultAccess(const char* msg) : std::runtime_error(msg) {}
};

/**
 * Result<T, E> - either a success value T or an error value E.
 *
 * Request handling reports recoverable failures (unreadable file, renderer
 * failure, bad config line) through Result instead of exceptions so that each
 * caller decides locally how the failure maps onto a response.
 *
 * Storage is a discriminated union sized for the larger of T and E; the
 * active member is tracked by m_isOk and destroyed explicitly.
 */
template <typename T, typename E>
class Result {
 private:
  union Storage {
    char dummy;
    struct {
      char tData[sizeof(T)];
      double tAligner;
    } tStorage;
    struct {
      char eData[sizeof(E)];
      double eAligner;
    } eStorage;
  } m_storage;

  bool m_isOk;

  T* GetTPtr() { return reinterpret_cast<T*>(&m_storage.tStorage.tData[0]); }
  const T* GetTPtr() const {
    return reinterpret_cast<const T*>(&m_storage.tStorage.tData[0]);
  }
  E* GetEPtr() { return reinterpret_cast<E*>(&m_storage.eStorage.eData[0]); }
  const E* GetEPtr() const {
    return reinterpret_cast<const E*>(&m_storage.eStorage.eData[0]);
  }

  void Destroy() {
    if (m_isOk)
      GetTPtr()->~T();
    else
      GetEPtr()->~E();
  }

  void CopyFrom(const Result& other) {
    m_isOk = other.m_isOk;
    if (m_isOk)
      new (GetTPtr()) T(*other.GetTPtr());
    else
      new (GetEPtr()) E(*other.GetEPtr());
  }

  struct ErrTag {};
  Result(ErrTag, const E& error) : m_isOk(false) { new (GetEPtr()) E(error); }

 public:
  explicit Result(const T& value) : m_isOk(true) { new (GetTPtr()) T(value); }

  Result(const Result& other) : m_isOk(other.m_isOk) { CopyFrom(other); }

  Result& operator=(const Result& other) {
    if (this != &other) {
      Destroy();
      CopyFrom(other);
    }
    return *this;
  }

  ~Result() { Destroy(); }

  static Result Ok(const T& value) { return Result(value); }
  static Result Err(const E& error) { return Result(ErrTag(), error); }

  bool IsOk() const { return m_isOk; }
  bool IsErr() const { return !m_isOk; }

  /**
   * @throws BadResultAccess if the Result holds an error
   */
  T& Unwrap() {
    if (!m_isOk) throw BadResultAccess("Called Unwrap() on Err Result");
    return *GetTPtr();
  }
  const T& Unwrap() const {
    if (!m_isOk) throw BadResultAccess("Called Unwrap() on Err Result");
    return *GetTPtr();
  }

  /**
   * @throws BadResultAccess if the Result holds a value
   */
  E& UnwrapErr() {
    if (m_isOk) throw BadResultAccess("Called UnwrapErr() on Ok Result");
    return *GetEPtr();
  }
  const E& UnwrapErr() const {
    if (m_isOk) throw BadResultAccess("Called UnwrapErr() on Ok Result");
    return *GetEPtr();
  }

  T* Get() { return m_isOk ? GetTPtr() : NULL; }
  const T* Get() const { return m_isOk ? GetTPtr() : NULL; }
  E* GetErr() { return m_isOk ? NULL : GetEPtr(); }
  const E* GetErr() const { return m_isOk ? NULL : GetEPtr(); }

  T UnwrapOr(const T& fallback) const {
    return m_isOk ? *GetTPtr() : fallback;
  }
};

}  // namespace markdownd
