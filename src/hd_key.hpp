#pragma once

#include <array>
#include <functional>
#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include "consts.hpp"
#include "curve.hpp"
#include "secure_bytes.hpp"

namespace cosmkit {

// What to do when a derivation step yields an unusable scalar (IL >= n or a
// zero child key). BIP32 says to move on to the next index; the default here
// is to report it so a caller never silently receives a different index.
enum class ChildPolicy {
    Surface,
    SkipToNextIndex
};

// Parsed BIP32 path such as m/44'/118'/0'/0/0
class DerivationPath {
public:
    struct Component {
        uint32_t index;   // Always < 2^31; hardening is kept separately
        bool hardened;

        bool operator==(const Component&) const = default;
    };

    DerivationPath() = default;

    // Accepts ' or h as the hardened marker. Throws DerivationError::InvalidPath.
    static DerivationPath parse(std::string_view text);

    // m/44'/coin_type'/account'/change/address_index
    static DerivationPath bip44(uint32_t coin_type, uint32_t account, uint32_t change, uint32_t address_index);

    // m/44'/118'/0'/0/address_index
    static DerivationPath cosmos(uint32_t address_index = 0);

    DerivationPath child(uint32_t index, bool hardened) const;

    std::string to_string() const;
    const std::vector<Component>& components() const { return components_; }
    size_t depth() const { return components_.size(); }

    bool operator==(const DerivationPath&) const = default;

private:
    std::vector<Component> components_;
};

struct ExtendedPublicKey {
    CompressedPoint key;
    std::array<uint8_t, CHAIN_CODE_SIZE> chaincode;
    uint8_t depth = 0;
    std::array<uint8_t, 4> parent_fingerprint{};
    uint32_t child_number = 0;    // Includes the hardened bit

    // First 4 bytes of HASH160(key)
    std::array<uint8_t, 4> fingerprint() const;
};

// Private node of the key tree. The scalar is erased on destruction.
struct ExtendedKey {
    Scalar key;
    std::array<uint8_t, CHAIN_CODE_SIZE> chaincode;
    uint8_t depth = 0;
    std::array<uint8_t, 4> parent_fingerprint{};
    uint32_t child_number = 0;    // Includes the hardened bit

    ExtendedKey() = default;
    ExtendedKey(const ExtendedKey&) = default;
    ExtendedKey& operator=(const ExtendedKey&) = default;
    ~ExtendedKey();

    CompressedPoint public_key() const;
    std::array<uint8_t, 4> fingerprint() const;

    // Drops the private half for watch-only derivation
    ExtendedPublicKey neuter() const;
};

// Utility class for BIP32 hierarchical deterministic derivation over secp256k1
class HdKey {
public:
    // Master node: HMAC-SHA512(key = "Bitcoin seed", seed)
    static ExtendedKey root_key(std::span<const uint8_t> seed);

    // index must be < 2^31; hardened selects the 2^31 + index child
    static ExtendedKey derive_child(const ExtendedKey& parent, uint32_t index, bool hardened,
                                    ChildPolicy policy = ChildPolicy::Surface);

    static ExtendedKey derive_path(std::span<const uint8_t> seed, const DerivationPath& path,
                                   ChildPolicy policy = ChildPolicy::Surface);

    static ExtendedKey derive_path(const ExtendedKey& from, std::span<const DerivationPath::Component> components,
                                   ChildPolicy policy = ChildPolicy::Surface);

    // Watch-only derivation. Hardened indices cannot be derived from a public key.
    static ExtendedPublicKey derive_public_child(const ExtendedPublicKey& parent, uint32_t index,
                                                 ChildPolicy policy = ChildPolicy::Surface);

    // I = HMAC-SHA512(parent chain code, data) for one child number
    using ChildMac = std::function<std::array<uint8_t, 64>(uint32_t child_number)>;

    // derive_child and derive_public_child with I supplied by the caller
    // instead of computed from the parent
    static ExtendedKey derive_child_with_mac(const ExtendedKey& parent, uint32_t index, bool hardened,
                                             ChildPolicy policy, const ChildMac& mac);
    static ExtendedPublicKey derive_public_child_with_mac(const ExtendedPublicKey& parent, uint32_t index,
                                                          ChildPolicy policy, const ChildMac& mac);

    // count consecutive non-hardened children starting at first
    static std::vector<ExtendedKey> derive_children(const ExtendedKey& parent, uint32_t first, uint32_t count);

private:
    HdKey() = delete;
};

// Memoizes derived keys for one seed. Safe for concurrent use.
//
// Cached private keys stay in memory until clear() or destruction, where
// they are erased. At most `capacity` paths are kept; keys derived once the
// cache is full are returned without being stored.
class DerivationCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    explicit DerivationCache(std::span<const uint8_t> seed, ChildPolicy policy = ChildPolicy::Surface,
                             size_t capacity = DEFAULT_CAPACITY);

    ExtendedKey derive(const DerivationPath& path);
    ExtendedKey derive(std::string_view path);

    size_t size() const;
    size_t capacity() const { return capacity_; }

    // Erases every cached key; the root stays
    void clear();

private:
    ChildPolicy policy_;
    size_t capacity_;
    ExtendedKey root_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ExtendedKey> cache_;
};

} // namespace cosmkit
