
#include "dirmirror/identity.h"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <pwd.h>
#include <cerrno>
#include <cstdlib>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>

namespace dirmirror {
namespace identity {

namespace {
    constexpr size_t ED25519_KEY_SIZE = 32;
    constexpr uint8_t KEY_TYPE_ED25519 = 1;
    constexpr uint8_t MULTIHASH_IDENTITY = 0x00;
    constexpr mode_t KEY_DIR_MODE = 0700;
    constexpr mode_t PRIVATE_KEY_MODE = 0600;
    constexpr mode_t PUBLIC_KEY_MODE = 0644;

    const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    struct PKeyDeleter {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };
    struct PKeyCtxDeleter {
        void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
    };
    using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
    using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

    std::vector<uint8_t> encode_key_message(const std::vector<uint8_t>& data) {
        std::vector<uint8_t> out;
        out.reserve(4 + data.size());
        out.push_back(0x08);                // field 1, varint: KeyType
        out.push_back(KEY_TYPE_ED25519);
        out.push_back(0x12);                // field 2, length-delimited: Data
        out.push_back(static_cast<uint8_t>(data.size()));
        out.insert(out.end(), data.begin(), data.end());
        return out;
    }

    bool read_varint(const std::vector<uint8_t>& bytes, size_t& pos, uint64_t& value) {
        value = 0;
        for (int shift = 0; shift < 64; shift += 7) {
            if (pos >= bytes.size()) return false;
            uint8_t byte = bytes[pos++];
            value |= static_cast<uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) return true;
        }
        return false;
    }

    Result<std::vector<uint8_t>> public_from_seed(const uint8_t* seed) {
        PKeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed, ED25519_KEY_SIZE));
        if (!key) {
            return Error(ErrorCode::DecodeError, "Invalid Ed25519 private key");
        }

        std::vector<uint8_t> public_key(ED25519_KEY_SIZE);
        size_t len = public_key.size();
        if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &len) != 1 || len != ED25519_KEY_SIZE) {
            return Error(ErrorCode::DecodeError, "Failed to derive Ed25519 public key");
        }
        return public_key;
    }

    Result<void> write_key(const std::string& path, const std::vector<uint8_t>& data, mode_t mode) {
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
        if (fd < 0) {
            int err = errno;
            return Error(ErrorCode::IoError, "Failed to open " + path + ": " + std::strerror(err));
        }

        size_t offset = 0;
        while (offset < data.size()) {
            ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
            if (written < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                ::close(fd);
                return Error(ErrorCode::IoError, "Failed to write " + path + ": " + std::strerror(err));
            }
            offset += static_cast<size_t>(written);
        }

        // the file may have existed with other bits, and open(2) honours the umask
        if (::fchmod(fd, mode) != 0) {
            int err = errno;
            ::close(fd);
            return Error(ErrorCode::IoError, "Failed to set permissions on " + path + ": " + std::strerror(err));
        }

        if (::close(fd) != 0) {
            int err = errno;
            return Error(ErrorCode::IoError, "Failed to close " + path + ": " + std::strerror(err));
        }
        return Result<void>();
    }

    Result<void> create_directories(const std::string& dir, mode_t mode) {
        struct stat st;
        if (::stat(dir.c_str(), &st) == 0) {
            if (!S_ISDIR(st.st_mode)) {
                return Error(ErrorCode::IoError, dir + " exists and is not a directory");
            }
            return Result<void>();
        }

        size_t last_slash = dir.find_last_of('/');
        if (last_slash != std::string::npos && last_slash > 0) {
            auto parent = create_directories(dir.substr(0, last_slash), mode);
            if (!parent.ok()) {
                return parent;
            }
        }

        if (::mkdir(dir.c_str(), mode) != 0 && errno != EEXIST) {
            int err = errno;
            return Error(ErrorCode::IoError, "Failed to create " + dir + ": " + std::strerror(err));
        }
        return Result<void>();
    }

    std::string key_path(const std::string& dir, const std::string& peer_id, const char* extension) {
        return dir + "/" + peer_id + "." + extension;
    }
}

std::string base58_encode(const std::vector<uint8_t>& bytes) {
    size_t leading_zeros = 0;
    while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // log(256) / log(58) ~ 1.37
    std::vector<uint8_t> digits((bytes.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = leading_zeros; i < bytes.size(); ++i) {
        int carry = bytes[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(leading_zeros, '1');
    for (; it != digits.end(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

std::string derive_peer_id(const std::vector<uint8_t>& public_key) {
    Keypair only_public;
    only_public.public_key = public_key;
    std::vector<uint8_t> encoded = encode_public_key(only_public);

    std::vector<uint8_t> multihash;
    multihash.reserve(2 + encoded.size());
    multihash.push_back(MULTIHASH_IDENTITY);
    multihash.push_back(static_cast<uint8_t>(encoded.size()));
    multihash.insert(multihash.end(), encoded.begin(), encoded.end());
    return base58_encode(multihash);
}

std::vector<uint8_t> encode_public_key(const Keypair& keypair) {
    return encode_key_message(keypair.public_key);
}

std::vector<uint8_t> encode_private_key(const Keypair& keypair) {
    std::vector<uint8_t> data(keypair.private_key);
    data.insert(data.end(), keypair.public_key.begin(), keypair.public_key.end());
    return encode_key_message(data);
}

Result<Keypair> decode_private_key(const std::vector<uint8_t>& bytes) {
    uint64_t key_type = 0;
    bool has_type = false;
    std::vector<uint8_t> data;

    size_t pos = 0;
    while (pos < bytes.size()) {
        uint64_t tag = 0;
        if (!read_varint(bytes, pos, tag)) {
            return Error(ErrorCode::DecodeError, "Truncated private key field tag");
        }

        uint64_t field = tag >> 3;
        uint64_t wire_type = tag & 0x7;
        if (field == 1 && wire_type == 0) {
            if (!read_varint(bytes, pos, key_type)) {
                return Error(ErrorCode::DecodeError, "Truncated private key type");
            }
            has_type = true;
        } else if (field == 2 && wire_type == 2) {
            uint64_t length = 0;
            if (!read_varint(bytes, pos, length) || length > bytes.size() - pos) {
                return Error(ErrorCode::DecodeError, "Truncated private key data");
            }
            data.assign(bytes.begin() + static_cast<std::ptrdiff_t>(pos),
                        bytes.begin() + static_cast<std::ptrdiff_t>(pos + length));
            pos += length;
        } else {
            return Error(ErrorCode::DecodeError, "Unexpected field in private key encoding");
        }
    }

    if (!has_type || key_type != KEY_TYPE_ED25519) {
        return Error(ErrorCode::DecodeError, "Private key is not an Ed25519 key");
    }
    if (data.size() != ED25519_KEY_SIZE && data.size() != 2 * ED25519_KEY_SIZE) {
        return Error(ErrorCode::DecodeError, "Invalid Ed25519 key length " + std::to_string(data.size()));
    }

    auto public_key = public_from_seed(data.data());
    if (!public_key.ok()) {
        return public_key.error();
    }
    if (data.size() == 2 * ED25519_KEY_SIZE &&
        !std::equal(public_key.value().begin(), public_key.value().end(), data.begin() + ED25519_KEY_SIZE)) {
        return Error(ErrorCode::DecodeError, "Stored public key does not match the private key");
    }

    Keypair keypair;
    keypair.private_key.assign(data.begin(), data.begin() + ED25519_KEY_SIZE);
    keypair.public_key = public_key.value();
    keypair.peer_id = derive_peer_id(keypair.public_key);
    return keypair;
}

Result<Keypair> generate_keypair() {
    PKeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        return Error(ErrorCode::Unknown, "Failed to initialise Ed25519 key generation");
    }

    EVP_PKEY* raw_key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw_key) != 1) {
        return Error(ErrorCode::Unknown, "Ed25519 key generation failed");
    }
    PKeyPtr key(raw_key);

    Keypair keypair;
    keypair.private_key.resize(ED25519_KEY_SIZE);
    keypair.public_key.resize(ED25519_KEY_SIZE);

    size_t private_len = keypair.private_key.size();
    size_t public_len = keypair.public_key.size();
    if (EVP_PKEY_get_raw_private_key(key.get(), keypair.private_key.data(), &private_len) != 1 ||
        EVP_PKEY_get_raw_public_key(key.get(), keypair.public_key.data(), &public_len) != 1 ||
        private_len != ED25519_KEY_SIZE || public_len != ED25519_KEY_SIZE) {
        return Error(ErrorCode::Unknown, "Failed to export Ed25519 key material");
    }

    keypair.peer_id = derive_peer_id(keypair.public_key);
    return keypair;
}

Result<void> check_key_directory(const std::string& dir) {
    struct stat st;
    if (::stat(dir.c_str(), &st) != 0) {
        int err = errno;
        if (err == ENOENT) {
            return Result<void>();
        }
        return Error(ErrorCode::IoError, "Cannot stat " + dir + ": " + std::strerror(err));
    }

    if (!S_ISDIR(st.st_mode)) {
        return Error(ErrorCode::IoError, dir + " is not a directory");
    }
    if ((st.st_mode & 077) != 0) {
        return Error(ErrorCode::SetupFailure, dir + " must not be accessible by group or others");
    }
    return Result<void>();
}

Result<std::string> save_keypair(const std::string& dir, const Keypair& keypair) {
    auto checked = check_key_directory(dir);
    if (!checked.ok()) {
        return checked.error();
    }

    auto created = create_directories(dir, KEY_DIR_MODE);
    if (!created.ok()) {
        return created.error();
    }

    const std::string peer_id = derive_peer_id(keypair.public_key);

    auto private_result = write_key(key_path(dir, peer_id, "private"), encode_private_key(keypair), PRIVATE_KEY_MODE);
    if (!private_result.ok()) {
        return private_result.error();
    }

    auto public_result = write_key(key_path(dir, peer_id, "public"), encode_public_key(keypair), PUBLIC_KEY_MODE);
    if (!public_result.ok()) {
        return public_result.error();
    }

    spdlog::debug("Saved keypair {} to {}", peer_id, dir);
    return peer_id;
}

Result<Keypair> load_keypair(const std::string& dir, const std::string& peer_id) {
    auto checked = check_key_directory(dir);
    if (!checked.ok()) {
        return checked.error();
    }

    const std::string private_path = key_path(dir, peer_id, "private");
    std::ifstream file(private_path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IoError, "Failed to read " + private_path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Error(ErrorCode::IoError, "Failed to read " + private_path);
    }

    auto keypair = decode_private_key(bytes);
    if (!keypair.ok()) {
        return Error(ErrorCode::DecodeError, "Invalid private key encoding in " + private_path + ": " +
                                             keypair.error().to_string());
    }

    if (keypair.value().peer_id != peer_id) {
        return Error(ErrorCode::PeerIdMismatch,
                     "Peer ID mismatch: expected " + peer_id + ", got " + keypair.value().peer_id);
    }

    return keypair;
}

Result<std::string> default_key_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        struct passwd* pw = ::getpwuid(::getuid());
        if (pw == nullptr || pw->pw_dir == nullptr) {
            return Error(ErrorCode::SetupFailure, "No home directory");
        }
        home = pw->pw_dir;
    }
    return std::string(home) + "/.dirmirror";
}

} // namespace identity
} // namespace dirmirror
