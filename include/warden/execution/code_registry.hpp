#pragma once

#include <warden/execution/contract.hpp>
#include <warden/schema/primitives.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace warden::execution {

/// Named factories for deployable logic units.
///
/// A factory rebuilds the logic unit for `self` from its constructor
/// arguments; the engine calls it at deployment and again for every persisted
/// contract account when it restarts.
class code_registry final {
 public:
  using factory_t = std::function<std::shared_ptr<contract>(
      const warden::schema::address_t& self,
      const warden::schema::bytes_view_t& constructor_args)>;

  void add(std::string name, factory_t factory);

  /// Register `Contract`, constructed as Contract{self, constructor_args}.
  template <typename Contract>
  void add(std::string name) {
    add(std::move(name),
        [](const warden::schema::address_t& self,
           const warden::schema::bytes_view_t& constructor_args) {
          return std::make_shared<Contract>(self, constructor_args);
        });
  }

  const factory_t* find(std::string_view name) const;
  bool contains(std::string_view name) const;

 private:
  std::map<std::string, factory_t, std::less<>> factories_;
};

}  // namespace warden::execution
