#pragma once

#include <warden/execution/abi.hpp>
#include <warden/execution/call_frame.hpp>
#include <warden/schema/primitives.hpp>

#include <functional>
#include <map>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace warden::execution {

class host;

/// Logic unit instantiated for one deployed code account.
///
/// Instances are shared across requests and hold only immutables captured at
/// instantiation (their own address, constructor arguments). Mutable state
/// lives in host storage so a failed request leaves no trace.
class contract {
 public:
  using handler_t =
      std::function<warden::schema::bytes_t(host&,
                                            const call_frame&,
                                            const warden::schema::bytes_view_t&)>;

  explicit contract(const warden::schema::address_t& self);
  virtual ~contract() = default;

  contract(const contract&) = delete;
  contract& operator=(const contract&) = delete;

  /// Address of the code account this logic unit was instantiated for.
  const warden::schema::address_t& self() const noexcept { return self_; }

  /// Runs once, when the account is deployed, with the deployer as sender.
  virtual void construct(host& runtime, const call_frame& frame);

  /// Dispatch `frame.data` to the handler registered for its selector.
  warden::schema::bytes_t invoke(host& runtime, const call_frame& frame) const;

  bool exposes(const warden::schema::selector_t& selector) const;

 protected:
  void expose(const warden::schema::selector_t& selector, handler_t handler);

  /// Register a typed entry point; arguments are SCALE-decoded into `Args...`
  /// and a non-void result is SCALE-encoded as return data.
  template <typename... Args, typename Fn>
  void expose(std::string_view signature, Fn&& fn);

  template <typename... Args, typename Fn>
  void expose(const warden::schema::selector_t& selector, Fn&& fn);

 private:
  warden::schema::address_t self_;
  std::map<warden::schema::selector_t, handler_t> handlers_;
};

template <typename... Args, typename Fn>
void contract::expose(const std::string_view signature, Fn&& fn) {
  expose<Args...>(abi::make_selector(signature), std::forward<Fn>(fn));
}

template <typename... Args, typename Fn>
void contract::expose(const warden::schema::selector_t& selector, Fn&& fn) {
  expose(selector,
         handler_t{[fn = std::forward<Fn>(fn)](
                       host& runtime, const call_frame& frame,
                       const warden::schema::bytes_view_t& args)
                       -> warden::schema::bytes_t {
           auto decoded = abi::decode_arguments<Args...>(args);
           using result_t = std::invoke_result_t<const std::decay_t<Fn>&, host&,
                                                 const call_frame&, Args&...>;
           if constexpr (std::is_void_v<result_t>) {
             std::apply(
                 [&](auto&... values) { fn(runtime, frame, values...); },
                 decoded);
             return {};
           } else {
             return abi::encode_result(std::apply(
                 [&](auto&... values) { return fn(runtime, frame, values...); },
                 decoded));
           }
         }});
}

}  // namespace warden::execution
