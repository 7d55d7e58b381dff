#include <warden/execution/code_registry.hpp>
#include <warden/execution/contract.hpp>

#include <utility>

namespace warden::execution {

contract::contract(const warden::schema::address_t& self) : self_{self} {}

void contract::construct(host&, const call_frame&) {}

warden::schema::bytes_t contract::invoke(host& runtime,
                                         const call_frame& frame) const {
  auto data = warden::schema::bytes_view_t{frame.data.data(), frame.data.size()};
  auto selector = abi::selector_of(data);
  require(selector.has_value(), warden::schema::error_code::invalid_calldata,
          "invocation data shorter than a selector");

  auto it = handlers_.find(*selector);
  require(it != std::end(handlers_),
          warden::schema::error_code::function_not_found,
          warden::schema::to_hex(*selector));
  return it->second(runtime, frame, abi::arguments_of(data));
}

bool contract::exposes(const warden::schema::selector_t& selector) const {
  return handlers_.contains(selector);
}

void contract::expose(const warden::schema::selector_t& selector,
                      handler_t handler) {
  handlers_.insert_or_assign(selector, std::move(handler));
}

void code_registry::add(std::string name, factory_t factory) {
  factories_.insert_or_assign(std::move(name), std::move(factory));
}

const code_registry::factory_t* code_registry::find(
    const std::string_view name) const {
  auto it = factories_.find(name);
  if (it == std::end(factories_)) {
    return nullptr;
  }
  return &it->second;
}

bool code_registry::contains(const std::string_view name) const {
  return find(name) != nullptr;
}

}  // namespace warden::execution
