#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/protocol/router.hpp>
#include <warden/protocol/security_module.hpp>
#include <warden/protocol/signatures.hpp>

#include <algorithm>
#include <iterator>

using namespace warden::schema;
using warden::execution::call_frame;
using warden::execution::host;

namespace warden::protocol {

namespace abi = warden::execution::abi;

security_module::security_module(const address_t& self) : contract{self} {
  expose<address_t, address_t, word_t, hash32_t, bytes_t>(
      signatures::kValidate,
      [this](host& runtime, const call_frame& frame, const address_t& caller,
             const address_t& target_self, const word_t& value,
             const hash32_t& invocation, const bytes_t& payload) {
        return validate(runtime, frame, caller, target_self, make_amount(value),
                        invocation, payload);
      });
}

bytes_t make_payload(const module_id_t& id, const bytes_view_t& body) {
  auto marker = abi::make_selector(signatures::kValidate);
  auto payload = bytes_t{std::begin(marker), std::end(marker)};
  payload.insert(std::end(payload), std::begin(id), std::end(id));
  payload.insert(std::end(payload), std::begin(body), std::end(body));
  if (payload.size() < kMinimumPayloadSize) {
    payload.resize(kMinimumPayloadSize, 0);
  }
  return payload;
}

}  // namespace warden::protocol
