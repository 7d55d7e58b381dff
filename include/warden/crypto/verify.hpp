#pragma once

#include <warden/schema/primitives.hpp>

#include <array>
#include <vector>

namespace warden::crypto {

/// True when the linked OpenSSL provides the secp256k1 curve.
bool available();

/// Compact [r || s] readings of a 65-byte credential. A credential whose
/// first and last bytes both look like recovery ids has two readings; one
/// with neither has none.
std::vector<std::array<uint8_t, 64>> canonical_signatures(
    const warden::schema::registrar_signature_t& signature);

/// Verify a registrar credential over `message` (ECDSA secp256k1, SHA-256).
/// Succeeds when any reading of the credential verifies.
bool verify_registrar_signature(
    const warden::schema::bytes_view_t& message,
    const warden::schema::registrar_key_t& registrar_key,
    const warden::schema::registrar_signature_t& signature);

}  // namespace warden::crypto
