#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/protocol/admin_transfer.hpp>
#include <warden/protocol/events.hpp>

using namespace warden::schema;
using warden::execution::call_frame;
using warden::execution::host;
using warden::execution::require;

namespace warden::protocol {

admin_transfer::admin_transfer(const std::string_view role)
    : role_{role},
      admin_slot_{execution::abi::make_slot("admin", role)},
      pending_slot_{execution::abi::make_slot("pending_admin", role)} {}

void admin_transfer::initialize(host& runtime,
                                const call_frame& frame,
                                const address_t& admin) const {
  require(!is_zero(admin), error_code::zero_address, role_);
  runtime.store_as(frame, admin_slot_, admin);
  runtime.emit(frame, events::make_event(
                          events::kAdminTransferred,
                          {events::attribute("role", role_),
                           events::attribute("previous",
                                             to_hex(make_zero_address())),
                           events::attribute("admin", to_hex(admin), true)}));
}

address_t admin_transfer::admin(host& runtime, const call_frame& frame) const {
  return runtime.load_as<address_t>(frame, admin_slot_)
      .value_or(make_zero_address());
}

address_t admin_transfer::pending_admin(host& runtime,
                                        const call_frame& frame) const {
  return runtime.load_as<address_t>(frame, pending_slot_)
      .value_or(make_zero_address());
}

bool admin_transfer::is_admin(host& runtime,
                              const call_frame& frame,
                              const address_t& account) const {
  auto current = admin(runtime, frame);
  return !is_zero(current) && current == account;
}

void admin_transfer::require_admin(host& runtime,
                                   const call_frame& frame) const {
  require(is_admin(runtime, frame, frame.sender), error_code::caller_not_admin,
          role_);
}

void admin_transfer::transfer(host& runtime,
                              const call_frame& frame,
                              const address_t& new_admin) const {
  require_admin(runtime, frame);
  if (is_zero(new_admin)) {
    runtime.erase(frame, pending_slot_);
  } else {
    runtime.store_as(frame, pending_slot_, new_admin);
  }
  runtime.emit(frame, events::make_event(
                          events::kAdminTransferStarted,
                          {events::attribute("role", role_),
                           events::attribute("admin", to_hex(frame.sender)),
                           events::attribute("pending", to_hex(new_admin),
                                             true)}));
}

void admin_transfer::accept(host& runtime, const call_frame& frame) const {
  auto pending = pending_admin(runtime, frame);
  require(!is_zero(pending) && pending == frame.sender,
          error_code::not_pending_admin, role_);
  auto previous = admin(runtime, frame);
  runtime.store_as(frame, admin_slot_, frame.sender);
  runtime.erase(frame, pending_slot_);
  runtime.emit(frame, events::make_event(
                          events::kAdminTransferred,
                          {events::attribute("role", role_),
                           events::attribute("previous", to_hex(previous)),
                           events::attribute("admin", to_hex(frame.sender),
                                             true)}));
}

}  // namespace warden::protocol
