#pragma once

#include <type_traits>
#include <utility>

namespace splitjoin {

// Non-owning function reference: an opaque object pointer plus a thunk.
// Copying is trivial and an empty callback is a no-op returning R{}.
template <class Signature>
struct callback;

template <class R, class... Args>
struct callback<R(Args...)> {
  using result_type = R;
  using thunk_fn = R (*)(void *, Args...);

  void * object = nullptr;
  thunk_fn thunk = nullptr;

  constexpr callback() noexcept = default;
  constexpr callback(void * obj, thunk_fn fn) noexcept : object(obj), thunk(fn) {}

  constexpr explicit operator bool() const noexcept { return thunk != nullptr; }

  R operator()(Args... args) const noexcept {
    if (thunk == nullptr) {
      if constexpr (std::is_void_v<R>) {
        return;
      } else {
        return R{};
      }
    }
    return thunk(object, std::forward<Args>(args)...);
  }

  // Binds a free function or static member known at compile time.
  template <auto Fn>
  static constexpr callback from() noexcept {
    return callback{
      nullptr,
      [](void *, Args... args) -> R { return Fn(std::forward<Args>(args)...); },
    };
  }

  // Binds a member function on an object that must outlive the callback.
  template <class T, auto MemFn>
  static constexpr callback from(T * obj) noexcept {
    return callback{
      const_cast<std::remove_const_t<T> *>(obj),
      [](void * ptr, Args... args) -> R {
        return (static_cast<T *>(ptr)->*MemFn)(std::forward<Args>(args)...);
      },
    };
  }
};

}  // namespace splitjoin
