#include <gtest/gtest.h>

#include <cstdio>
#include <sys/stat.h>

#include "dirmirror/identity.h"
#include "test_util.h"

using namespace dirmirror;

TEST(IdentityTest, GeneratedPeerIdHasLibp2pShape) {
    auto keypair = identity::generate_keypair();
    ASSERT_TRUE(keypair.ok()) << keypair.error().to_string();
    EXPECT_EQ(keypair.value().private_key.size(), 32u);
    EXPECT_EQ(keypair.value().public_key.size(), 32u);
    EXPECT_EQ(keypair.value().peer_id.rfind("12D3KooW", 0), 0u) << keypair.value().peer_id;
    EXPECT_EQ(keypair.value().peer_id, identity::derive_peer_id(keypair.value().public_key));
}

TEST(IdentityTest, PublicKeyEncodingPrefix) {
    auto keypair = identity::generate_keypair();
    ASSERT_TRUE(keypair.ok());

    auto encoded = identity::encode_public_key(keypair.value());
    ASSERT_EQ(encoded.size(), 36u);
    EXPECT_EQ(encoded[0], 0x08);
    EXPECT_EQ(encoded[1], 0x01);
    EXPECT_EQ(encoded[2], 0x12);
    EXPECT_EQ(encoded[3], 0x20);
}

TEST(IdentityTest, PrivateKeyDecodesToSameIdentity) {
    auto keypair = identity::generate_keypair();
    ASSERT_TRUE(keypair.ok());

    auto encoded = identity::encode_private_key(keypair.value());
    ASSERT_EQ(encoded.size(), 68u);
    EXPECT_EQ(encoded[3], 0x40);

    auto decoded = identity::decode_private_key(encoded);
    ASSERT_TRUE(decoded.ok()) << decoded.error().to_string();
    EXPECT_EQ(decoded.value().peer_id, keypair.value().peer_id);
    EXPECT_EQ(decoded.value().private_key, keypair.value().private_key);
}

TEST(IdentityTest, DecodeRejectsGarbage) {
    auto truncated = identity::decode_private_key({0x08, 0x01, 0x12, 0x40, 0x01});
    ASSERT_FALSE(truncated.ok());
    EXPECT_EQ(truncated.error().code(), ErrorCode::DecodeError);

    auto wrong_type = identity::decode_private_key({0x08, 0x02, 0x12, 0x00});
    ASSERT_FALSE(wrong_type.ok());
    EXPECT_EQ(wrong_type.error().code(), ErrorCode::DecodeError);
}

TEST(IdentityTest, DecodeRejectsMismatchedPublicHalf) {
    auto keypair = identity::generate_keypair();
    ASSERT_TRUE(keypair.ok());

    auto encoded = identity::encode_private_key(keypair.value());
    encoded.back() ^= 0xFF;
    EXPECT_FALSE(identity::decode_private_key(encoded).ok());
}

TEST(IdentityTest, Base58KnownVectors) {
    EXPECT_EQ(identity::base58_encode({}), "");
    EXPECT_EQ(identity::base58_encode({0x00, 0x00}), "11");
    EXPECT_EQ(identity::base58_encode({'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd'}), "StV1DL6CwTryKyV");
    EXPECT_EQ(identity::base58_encode({0x00, 0x01}), "12");
}

TEST(IdentityTest, SaveAndLoadRoundTrip) {
    test::TempDir base;
    const std::string dir = base / "keys";

    auto keypair = identity::generate_keypair();
    ASSERT_TRUE(keypair.ok());

    auto peer_id = identity::save_keypair(dir, keypair.value());
    ASSERT_TRUE(peer_id.ok()) << peer_id.error().to_string();
    EXPECT_EQ(peer_id.value(), keypair.value().peer_id);

    EXPECT_EQ(test::file_mode(dir), 0700u);
    EXPECT_EQ(test::file_mode(dir + "/" + peer_id.value() + ".private"), 0600u);
    EXPECT_EQ(test::file_mode(dir + "/" + peer_id.value() + ".public"), 0644u);

    auto loaded = identity::load_keypair(dir, peer_id.value());
    ASSERT_TRUE(loaded.ok()) << loaded.error().to_string();
    EXPECT_EQ(loaded.value().public_key, keypair.value().public_key);
}

TEST(IdentityTest, LoadDetectsPeerIdMismatch) {
    test::TempDir dir;

    auto first = identity::generate_keypair();
    auto second = identity::generate_keypair();
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    auto saved = identity::save_keypair(dir.path(), first.value());
    ASSERT_TRUE(saved.ok());

    const std::string claimed = second.value().peer_id;
    ASSERT_EQ(std::rename((dir / (saved.value() + ".private")).c_str(), (dir / (claimed + ".private")).c_str()), 0);

    auto loaded = identity::load_keypair(dir.path(), claimed);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.error().code(), ErrorCode::PeerIdMismatch);
}

TEST(IdentityTest, LoadMissingKeyIsIoError) {
    test::TempDir dir;
    auto loaded = identity::load_keypair(dir.path(), "12D3KooWnotthere");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.error().code(), ErrorCode::IoError);
}

TEST(IdentityTest, LoadCorruptKeyIsDecodeError) {
    test::TempDir dir;
    test::write_file(dir / "peer.private", "not a key", 0600);

    auto loaded = identity::load_keypair(dir.path(), "peer");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.error().code(), ErrorCode::DecodeError);
}

TEST(IdentityTest, RejectsGroupReadableKeyDirectory) {
    test::TempDir base;
    const std::string dir = base / "loose";
    ASSERT_EQ(::mkdir(dir.c_str(), 0755), 0);
    ASSERT_EQ(::chmod(dir.c_str(), 0755), 0);

    auto checked = identity::check_key_directory(dir);
    ASSERT_FALSE(checked.ok());
    EXPECT_EQ(checked.error().code(), ErrorCode::SetupFailure);

    auto keypair = identity::generate_keypair();
    ASSERT_TRUE(keypair.ok());
    EXPECT_FALSE(identity::save_keypair(dir, keypair.value()).ok());
}

TEST(IdentityTest, MissingKeyDirectoryIsAccepted) {
    test::TempDir base;
    EXPECT_TRUE(identity::check_key_directory(base / "not-yet").ok());
}

TEST(IdentityTest, SavedKeypairLoadsBackUnderItsPeerId) {
    test::TempDir dir;

    auto keypair = identity::generate_keypair();
    ASSERT_TRUE(keypair.ok());
    auto peer_id = identity::save_keypair(dir.path(), keypair.value());
    ASSERT_TRUE(peer_id.ok());

    ASSERT_TRUE(identity::check_key_directory(dir.path()).ok());
    auto loaded = identity::load_keypair(dir.path(), peer_id.value());
    ASSERT_TRUE(loaded.ok()) << loaded.error().to_string();
    EXPECT_EQ(identity::derive_peer_id(loaded.value().public_key), peer_id.value());
    EXPECT_EQ(loaded.value().private_key, keypair.value().private_key);
}
