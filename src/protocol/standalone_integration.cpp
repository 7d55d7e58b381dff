#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/protocol/events.hpp>
#include <warden/protocol/standalone_integration.hpp>

#include <string>
#include <vector>

using namespace warden::schema;
using warden::execution::call_frame;
using warden::execution::host;
using warden::execution::require;

namespace warden::protocol {

namespace {

bytes_t flag_slot(const selector_t& selector) {
  return execution::abi::make_slot("protection_flag", selector);
}

}  // namespace

void standalone_integration::construct(host& runtime, const call_frame& frame) {
  security_admin().initialize(runtime, frame, frame.sender);
  pre_register(runtime, frame);
}

void standalone_integration::check_identity(host&,
                                            const call_frame& frame) const {
  require(frame.self == self(), error_code::delegation_not_permitted,
          to_hex(frame.self));
}

bool standalone_integration::protection_enabled(
    host& runtime,
    const call_frame& frame,
    const selector_t& selector) const {
  return runtime.load_as<bool>(frame, flag_slot(selector)).value_or(false);
}

std::vector<bool> standalone_integration::protection_status(
    host& runtime,
    const call_frame& frame,
    const std::vector<selector_t>& selectors) const {
  auto out = std::vector<bool>{};
  out.reserve(selectors.size());
  for (const auto& selector : selectors) {
    out.push_back(protection_enabled(runtime, frame, selector));
  }
  return out;
}

void standalone_integration::write_protection(
    host& runtime,
    const call_frame& frame,
    const std::vector<selector_t>& selectors,
    const std::vector<bool>& flags) const {
  require(selectors.size() == flags.size(), error_code::array_length_mismatch);
  check_identity(runtime, frame);

  auto joined_selectors = std::string{};
  auto joined_flags = std::string{};
  for (std::size_t i = 0; i < selectors.size(); ++i) {
    runtime.store_as(frame, flag_slot(selectors[i]),
                     static_cast<bool>(flags[i]));
    if (i > 0) {
      joined_selectors += ',';
      joined_flags += ',';
    }
    joined_selectors += to_hex(selectors[i]);
    joined_flags += flags[i] ? "true" : "false";
  }
  runtime.emit(frame, events::make_event(
                          events::kProtectionFlagsUpdated,
                          {events::attribute("identity", to_hex(self()), true),
                           events::attribute("selectors", joined_selectors),
                           events::attribute("flags", joined_flags)}));
}

}  // namespace warden::protocol
