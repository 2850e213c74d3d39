/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}

#include "common/blob.hpp"

namespace tessera::crypto::constants::ed25519 {
  /**
   * Important constants to deal with ed25519
   */
  enum {  // NOLINT(performance-enum-size)
    PRIVKEY_SIZE = ED25519_SECRET_KEY_LENGTH,
    PUBKEY_SIZE = ED25519_PUBLIC_KEY_LENGTH,
    SIGNATURE_SIZE = ED25519_SIGNATURE_LENGTH,
    SEED_SIZE = PRIVKEY_SIZE,
  };
}  // namespace tessera::crypto::constants::ed25519

TESSERA_BLOB_STRICT_TYPEDEF(tessera::crypto,
                            Ed25519PublicKey,
                            constants::ed25519::PUBKEY_SIZE);
TESSERA_BLOB_STRICT_TYPEDEF(tessera::crypto,
                            Ed25519Signature,
                            constants::ed25519::SIGNATURE_SIZE);
TESSERA_BLOB_STRICT_TYPEDEF(tessera::crypto,
                            Ed25519PrivateKey,
                            constants::ed25519::PRIVKEY_SIZE);
TESSERA_BLOB_STRICT_TYPEDEF(tessera::crypto,
                            Ed25519Seed,
                            constants::ed25519::SEED_SIZE);

namespace tessera::crypto {

  struct Ed25519Keypair {
    Ed25519PrivateKey secret_key;
    Ed25519PublicKey public_key;

    bool operator==(const Ed25519Keypair &other) const;
    bool operator!=(const Ed25519Keypair &other) const;
  };

}  // namespace tessera::crypto
