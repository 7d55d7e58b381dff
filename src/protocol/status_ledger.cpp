#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/protocol/events.hpp>
#include <warden/protocol/status_ledger.hpp>

#include <string>
#include <type_traits>

using namespace warden::schema;
using warden::execution::call_frame;
using warden::execution::host;
using warden::execution::require;

namespace warden::protocol {

namespace {

bytes_t record_slot(const address_t& identity) {
  return execution::abi::make_slot("integration", identity);
}

bytes_t flag_slot(const address_t& identity, const selector_t& selector) {
  return execution::abi::make_slot("protection_flag", identity, selector);
}

template <typename T>
std::string join(const std::vector<T>& values) {
  auto out = std::string{};
  for (const auto& value : values) {
    if (!out.empty()) {
      out += ",";
    }
    if constexpr (std::is_same_v<T, bool>) {
      out += value ? "1" : "0";
    } else {
      out += to_hex(value);
    }
  }
  return out;
}

}  // namespace

integration_record_t status_ledger::record(host& runtime,
                                           const call_frame& frame,
                                           const address_t& identity) const {
  return runtime.load_as<integration_record_t>(frame, record_slot(identity))
      .value_or(integration_record_t{});
}

bool status_ledger::flag(host& runtime,
                         const call_frame& frame,
                         const address_t& identity,
                         const selector_t& selector) const {
  return runtime.load_as<bool>(frame, flag_slot(identity, selector))
      .value_or(false);
}

void status_ledger::authenticate(host& runtime,
                                 const call_frame& frame,
                                 const address_t& identity) const {
  require(frame.sender_code == identity, error_code::caller_not_integration,
          to_hex(frame.sender_code));
  auto current = record(runtime, frame, identity);
  require(!is_zero(current.host) && current.host == frame.sender,
          error_code::caller_not_integration, to_hex(frame.sender));
}

void status_ledger::pre_register(host& runtime,
                                 const call_frame& frame,
                                 const address_t& identity) const {
  require(frame.sender_code == identity, error_code::caller_not_integration,
          to_hex(frame.sender_code));
  auto current = record(runtime, frame, identity);
  if (is_zero(current.host)) {
    current.host = frame.sender;
    write_record(runtime, frame, identity, current);
  }
  require(current.host == frame.sender,
          error_code::integration_host_mismatch, to_hex(frame.sender));

  if (current.registration == registration_status_t::registered) {
    return;
  }
  set_registration(runtime, frame, identity, current,
                   registration_status_t::pending);
}

void status_ledger::complete_registration(host& runtime,
                                          const call_frame& frame,
                                          const address_t& host_address,
                                          const address_t& identity) const {
  auto current = record(runtime, frame, identity);
  require(current.registration == registration_status_t::pending &&
              current.host == host_address,
          error_code::not_registered_pending, to_hex(identity));
  set_registration(runtime, frame, identity, current,
                   registration_status_t::registered);
  set_authorization(runtime, frame, identity, current,
                    authorization_status_t::active);
}

void status_ledger::update_flags(host& runtime,
                                 const call_frame& frame,
                                 const address_t& identity,
                                 const std::vector<selector_t>& selectors,
                                 const std::vector<bool>& flags) const {
  require(selectors.size() == flags.size(),
          error_code::array_length_mismatch);
  authenticate(runtime, frame, identity);
  require(record(runtime, frame, identity).registration !=
              registration_status_t::unregistered,
          error_code::integration_not_registered, to_hex(identity));

  for (std::size_t i = 0; i < selectors.size(); ++i) {
    runtime.store_as(frame, flag_slot(identity, selectors[i]),
                     static_cast<bool>(flags[i]));
  }
  runtime.emit(frame,
               events::make_event(
                   events::kProtectionFlagsUpdated,
                   {events::attribute("identity", to_hex(identity), true),
                    events::attribute("selectors", join(selectors)),
                    events::attribute("flags", join(flags))}));
}

std::vector<bool> status_ledger::query_flags(
    host& runtime,
    const call_frame& frame,
    const address_t& identity,
    const std::vector<selector_t>& selectors) const {
  require(record(runtime, frame, identity).registration !=
              registration_status_t::unregistered,
          error_code::integration_not_registered, to_hex(identity));
  auto flags = std::vector<bool>{};
  flags.reserve(selectors.size());
  for (const auto& selector : selectors) {
    flags.push_back(flag(runtime, frame, identity, selector));
  }
  return flags;
}

void status_ledger::pre_authorize_upgrade(host& runtime,
                                          const call_frame& frame,
                                          const address_t& current,
                                          const address_t& next) const {
  authenticate(runtime, frame, current);
  require(!is_zero(next), error_code::zero_address, "new implementation");
  require(current != next, error_code::only_distinct_implementation);
  runtime.emit(frame, events::make_event(
                          events::kUpgradePreAuthorized,
                          {events::attribute("host", to_hex(frame.sender)),
                           events::attribute("current", to_hex(current), true),
                           events::attribute("next", to_hex(next), true)}));
}

void status_ledger::override_authorization(
    host& runtime,
    const call_frame& frame,
    const address_t& identity,
    const authorization_status_t status) const {
  auto current = record(runtime, frame, identity);
  set_authorization(runtime, frame, identity, current, status);
}

void status_ledger::override_registration(
    host& runtime,
    const call_frame& frame,
    const address_t& identity,
    const registration_status_t status) const {
  auto current = record(runtime, frame, identity);
  set_registration(runtime, frame, identity, current, status);
}

void status_ledger::write_record(host& runtime,
                                 const call_frame& frame,
                                 const address_t& identity,
                                 const integration_record_t& record) const {
  runtime.store_as(frame, record_slot(identity), record);
}

void status_ledger::set_registration(host& runtime,
                                     const call_frame& frame,
                                     const address_t& identity,
                                     integration_record_t& record,
                                     const registration_status_t status) const {
  auto previous = record.registration;
  record.registration = status;
  write_record(runtime, frame, identity, record);
  runtime.emit(frame,
               events::make_event(
                   events::kRegistrationStatusChanged,
                   {events::attribute("identity", to_hex(identity), true),
                    events::attribute("host", to_hex(record.host)),
                    events::attribute("previous",
                                      std::string{to_string(previous)}),
                    events::attribute("status",
                                      std::string{to_string(status)})}));
}

void status_ledger::set_authorization(
    host& runtime,
    const call_frame& frame,
    const address_t& identity,
    integration_record_t& record,
    const authorization_status_t status) const {
  auto previous = record.authorization;
  record.authorization = status;
  write_record(runtime, frame, identity, record);
  runtime.emit(frame,
               events::make_event(
                   events::kAuthorizationStatusChanged,
                   {events::attribute("identity", to_hex(identity), true),
                    events::attribute("host", to_hex(record.host)),
                    events::attribute("previous",
                                      std::string{to_string(previous)}),
                    events::attribute("status",
                                      std::string{to_string(status)})}));
}

}  // namespace warden::protocol
