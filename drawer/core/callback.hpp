#ifndef AB586C5E_1253_4BA8_911C_697D3E29B6EC
#define AB586C5E_1253_4BA8_911C_697D3E29B6EC

#include <functional>
#include <memory>
#include <utility>
#include <vector>
#include <boost/container/small_vector.hpp>

namespace drawer {

template <typename... TArgs> struct CallbackRegistry;

// Releasing the last reference to a handle unregisters the callback
template <typename... TArgs> struct CallbackHandleImpl {
  std::weak_ptr<CallbackRegistry<TArgs...>> reg;

  virtual void call(TArgs... args) = 0;

  virtual ~CallbackHandleImpl() {
    if (auto r = reg.lock()) {
      r->remove(this);
    }
  }
};

template <typename... TArgs> using CallbackHandle = std::shared_ptr<CallbackHandleImpl<TArgs...>>;

template <typename... TArgs> struct FunctionCallback final : public CallbackHandleImpl<TArgs...> {
  std::function<void(TArgs...)> fn;

  FunctionCallback(std::function<void(TArgs...)> fn) : fn(std::move(fn)) {}
  void call(TArgs... args) override { fn(args...); }
};

// Not thread safe, callbacks are only registered and invoked from the frame thread
//  callbacks may register or release handles from inside call()
template <typename... TArgs> struct CallbackRegistry : public std::enable_shared_from_this<CallbackRegistry<TArgs...>> {
  using Item = CallbackHandleImpl<TArgs...>;
  using ItemPtr = std::shared_ptr<Item>;

  std::vector<std::weak_ptr<Item>> callbacks;

  void call(TArgs... args) {
    // Iterate a snapshot so handles added or released during the call don't invalidate the loop
    //  each entry is locked right before it runs, a handle released by an earlier callback is skipped
    boost::container::small_vector<std::weak_ptr<Item>, 8> snapshot;
    for (auto it = callbacks.begin(); it != callbacks.end();) {
      if (it->expired()) {
        it = callbacks.erase(it);
      } else {
        snapshot.push_back(*it);
        ++it;
      }
    }

    for (auto &weak : snapshot) {
      if (auto cb = weak.lock())
        cb->call(args...);
    }
  }

  template <typename T, typename... TArgs1> std::shared_ptr<T> emplace(TArgs1 &&...args) {
    auto e = std::make_shared<T>(std::forward<TArgs1>(args)...);
    e->reg = this->shared_from_this();
    callbacks.push_back(e);
    return e;
  }

  CallbackHandle<TArgs...> add(std::function<void(TArgs...)> fn) {
    return emplace<FunctionCallback<TArgs...>>(std::move(fn));
  }

  void remove(Item *item) {
    for (auto it = callbacks.begin(); it != callbacks.end();) {
      auto locked = it->lock();
      if (!locked || locked.get() == item) {
        it = callbacks.erase(it);
      } else {
        ++it;
      }
    }
  }

  size_t size() const {
    size_t count{};
    for (auto &cb : callbacks) {
      if (!cb.expired())
        ++count;
    }
    return count;
  }
};

} // namespace drawer

#endif /* AB586C5E_1253_4BA8_911C_697D3E29B6EC */
