
#ifndef DIRMIRROR_IDENTITY_H
#define DIRMIRROR_IDENTITY_H

#include <cstdint>
#include <string>
#include <vector>

#include "dirmirror/result.h"

namespace dirmirror {
namespace identity {

/**
 * Ed25519 peer identity.
 *
 * private_key holds the 32-byte seed, public_key the 32-byte public key.
 * peer_id is the base58 identity multihash of the protobuf public key, the
 * same form libp2p peers use ("12D3KooW...").
 */
struct Keypair {
    std::string peer_id;
    std::vector<uint8_t> private_key;
    std::vector<uint8_t> public_key;
};

Result<Keypair> generate_keypair();

// KeyType/Data protobuf messages, private data is seed || public key
std::vector<uint8_t> encode_public_key(const Keypair& keypair);
std::vector<uint8_t> encode_private_key(const Keypair& keypair);
Result<Keypair> decode_private_key(const std::vector<uint8_t>& bytes);

std::string derive_peer_id(const std::vector<uint8_t>& public_key);
std::string base58_encode(const std::vector<uint8_t>& bytes);

/**
 * Writes <dir>/<peer_id>.private (0600) and <dir>/<peer_id>.public (0644),
 * creating dir with mode 0700 when missing.
 * @return the peer id
 */
Result<std::string> save_keypair(const std::string& dir, const Keypair& keypair);

/**
 * Loads <dir>/<peer_id>.private.
 * Fails with IoError, DecodeError, or PeerIdMismatch when the stored key
 * derives a different peer id.
 */
Result<Keypair> load_keypair(const std::string& dir, const std::string& peer_id);

// A missing directory is fine, an existing one must not grant group/other access.
Result<void> check_key_directory(const std::string& dir);

Result<std::string> default_key_directory();

} // namespace identity
} // namespace dirmirror

#endif /* DIRMIRROR_IDENTITY_H */
