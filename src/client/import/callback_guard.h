#pragma once

#include <memory>
#include <utility>

namespace chatimport::client {

// Wraps fn so that it becomes a no-op once the owner's token is released.
template <typename Fn>
auto guarded(const std::shared_ptr<bool>& token, Fn fn) {
  std::weak_ptr<bool> weak = token;
  return [weak, fn](auto&&... args) {
    if (weak.lock()) {
      fn(std::forward<decltype(args)>(args)...);
    }
  };
}

}  // namespace chatimport::client
