#pragma once

#include <oracle/schema/primitives.hpp>

namespace oracle::crypto {

bool available();

bool verify_signature(const oracle::schema::bytes_view_t& message,
                      const oracle::schema::public_key_t& public_key,
                      const oracle::schema::ed25519_signature_t& signature);

/// True when `compressed` decompresses to a point of the ed25519 curve,
/// i.e. the 32 bytes could be somebody's public key.
bool is_on_curve(const oracle::schema::hash32_t& compressed);

}  // namespace oracle::crypto
