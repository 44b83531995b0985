#include "hd_key.hpp"
#include "hash_utils.hpp"
#include "error.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <charconv>

namespace cosmkit {

namespace {

std::array<uint8_t, 4> ser32(uint32_t value) {
    return {
        static_cast<uint8_t>((value >> 24) & 0xff),
        static_cast<uint8_t>((value >> 16) & 0xff),
        static_cast<uint8_t>((value >> 8) & 0xff),
        static_cast<uint8_t>(value & 0xff)
    };
}

std::array<uint8_t, 4> fingerprint_of(std::span<const uint8_t> public_key) {
    auto id = HashUtils::hash160(public_key);
    return {id[0], id[1], id[2], id[3]};
}

DerivationError invalid_path(std::string_view text, const std::string& why) {
    return DerivationError(DerivationError::ErrorType::InvalidPath,
                           "Invalid derivation path '" + std::string(text) + "': " + why);
}

void check_index(uint32_t index) {
    if (index >= HARDENED_OFFSET) {
        throw DerivationError(DerivationError::ErrorType::InvalidPath,
                              "Child index " + std::to_string(index) + " is out of range");
    }
}

} // namespace

// Parses a derivation path string.
//
// The path format:
// - "m" is the master key and must come first
// - "/" separates components
// - A component is a decimal index below 2^31, optionally followed by ' or h
//   for hardened derivation
DerivationPath DerivationPath::parse(std::string_view text) {
    if (text.empty() || text[0] != 'm') {
        throw invalid_path(text, "must start with 'm'");
    }
    if (text.size() == 1) {
        return DerivationPath{};
    }
    if (text[1] != '/') {
        throw invalid_path(text, "expected '/' after 'm'");
    }

    DerivationPath path;
    std::string_view rest = text.substr(2);
    while (true) {
        auto slash = rest.find('/');
        std::string_view segment = rest.substr(0, slash);

        bool hardened = !segment.empty() && (segment.back() == '\'' || segment.back() == 'h');
        if (hardened) {
            segment.remove_suffix(1);
        }
        if (segment.empty()) {
            throw invalid_path(text, "empty component");
        }

        uint64_t index = 0;
        auto [end, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
        if (ec != std::errc{} || end != segment.data() + segment.size()) {
            throw invalid_path(text, "component '" + std::string(segment) + "' is not a number");
        }
        if (index >= HARDENED_OFFSET) {
            throw invalid_path(text, "index " + std::string(segment) + " is out of range");
        }
        path.components_.push_back({static_cast<uint32_t>(index), hardened});

        if (slash == std::string_view::npos) {
            break;
        }
        rest = rest.substr(slash + 1);
    }
    return path;
}

DerivationPath DerivationPath::bip44(uint32_t coin_type, uint32_t account, uint32_t change, uint32_t address_index) {
    check_index(coin_type);
    check_index(account);
    check_index(change);
    check_index(address_index);

    DerivationPath path;
    path.components_ = {
        {44, true},
        {coin_type, true},
        {account, true},
        {change, false},
        {address_index, false}
    };
    return path;
}

DerivationPath DerivationPath::cosmos(uint32_t address_index) {
    return bip44(118, 0, 0, address_index);
}

DerivationPath DerivationPath::child(uint32_t index, bool hardened) const {
    check_index(index);
    DerivationPath next = *this;
    next.components_.push_back({index, hardened});
    return next;
}

std::string DerivationPath::to_string() const {
    std::string out = "m";
    for (const auto& component : components_) {
        out += '/';
        out += std::to_string(component.index);
        if (component.hardened) {
            out += '\'';
        }
    }
    return out;
}

std::array<uint8_t, 4> ExtendedPublicKey::fingerprint() const {
    return fingerprint_of(key);
}

ExtendedKey::~ExtendedKey() {
    OPENSSL_cleanse(key.data(), key.size());
    OPENSSL_cleanse(chaincode.data(), chaincode.size());
}

CompressedPoint ExtendedKey::public_key() const {
    return Curve::multiply_generator(key);
}

std::array<uint8_t, 4> ExtendedKey::fingerprint() const {
    return fingerprint_of(public_key());
}

ExtendedPublicKey ExtendedKey::neuter() const {
    ExtendedPublicKey pub;
    pub.key = public_key();
    pub.chaincode = chaincode;
    pub.depth = depth;
    pub.parent_fingerprint = parent_fingerprint;
    pub.child_number = child_number;
    return pub;
}

// Generates the master node from a BIP39 seed.
//
// I = HMAC-SHA512(key = "Bitcoin seed", data = seed)
// The left 32 bytes of I are the master scalar and the right 32 bytes the
// master chain code. A scalar of zero or >= n cannot be used.
ExtendedKey HdKey::root_key(std::span<const uint8_t> seed) {
    std::string_view seed_key = BIP32_SEED_KEY;
    auto mac = HashUtils::hmac_sha512(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(seed_key.data()), seed_key.size()),
        seed);

    ExtendedKey master;
    std::copy_n(mac.begin(), 32, master.key.begin());
    std::copy_n(mac.begin() + 32, 32, master.chaincode.begin());
    OPENSSL_cleanse(mac.data(), mac.size());

    if (!Curve::is_valid_scalar(master.key)) {
        throw DerivationError(DerivationError::ErrorType::ScalarOutOfRange,
                              "Seed produces an invalid master key");
    }
    return master;
}

// Derives a child private key according to BIP32.
//
// The derivation process:
// 1. Build the HMAC data from the parent and the child number i
//    - hardened (i >= 2^31): 0x00 || parent private key || ser32(i)
//    - normal:               compressed parent public key || ser32(i)
// 2. I = HMAC-SHA512(key = parent chain code, data)
// 3. child key = (IL + parent key) mod n, child chain code = IR
//
// If IL >= n or the child key is zero the index has no valid key. Under
// ChildPolicy::Surface that is an error; under SkipToNextIndex derivation
// moves on to i + 1 in the same hardening class.
ExtendedKey HdKey::derive_child(const ExtendedKey& parent, uint32_t index, bool hardened, ChildPolicy policy) {
    return derive_child_with_mac(parent, index, hardened, policy, [&parent, hardened](uint32_t child_num) {
        std::vector<uint8_t> data;
        data.reserve(37);
        if (hardened) {
            data.push_back(0x00);
            data.insert(data.end(), parent.key.begin(), parent.key.end());
        } else {
            auto pubkey = parent.public_key();
            data.insert(data.end(), pubkey.begin(), pubkey.end());
        }
        auto child_num_be = ser32(child_num);
        data.insert(data.end(), child_num_be.begin(), child_num_be.end());

        auto mac = HashUtils::hmac_sha512(parent.chaincode, data);
        OPENSSL_cleanse(data.data(), data.size());
        return mac;
    });
}

ExtendedKey HdKey::derive_child_with_mac(const ExtendedKey& parent, uint32_t index, bool hardened,
                                         ChildPolicy policy, const ChildMac& next_mac) {
    check_index(index);

    while (true) {
        const uint32_t child_num = hardened ? index + HARDENED_OFFSET : index;
        auto mac = next_mac(child_num);

        std::span<const uint8_t> il(mac.data(), 32);
        bool usable = Curve::is_valid_scalar(il);

        ExtendedKey child;
        if (usable) {
            child.key = Curve::add_mod_order(il, parent.key);
            usable = Curve::is_valid_scalar(child.key);
        }

        if (usable) {
            std::copy_n(mac.begin() + 32, 32, child.chaincode.begin());
            child.depth = static_cast<uint8_t>(parent.depth + 1);
            child.parent_fingerprint = parent.fingerprint();
            child.child_number = child_num;
            OPENSSL_cleanse(mac.data(), mac.size());
            return child;
        }
        OPENSSL_cleanse(mac.data(), mac.size());

        if (policy == ChildPolicy::Surface) {
            throw DerivationError(DerivationError::ErrorType::ScalarOutOfRange,
                                  "Child index " + std::to_string(index) + " yields an invalid key");
        }
        if (index + 1 >= HARDENED_OFFSET) {
            throw DerivationError(DerivationError::ErrorType::InvalidPath,
                                  "No valid child key left after index " + std::to_string(index));
        }
        ++index;
    }
}

// Folds derive_child over each component, starting at the master node
ExtendedKey HdKey::derive_path(std::span<const uint8_t> seed, const DerivationPath& path, ChildPolicy policy) {
    return derive_path(root_key(seed), path.components(), policy);
}

ExtendedKey HdKey::derive_path(const ExtendedKey& from, std::span<const DerivationPath::Component> components,
                               ChildPolicy policy) {
    ExtendedKey current = from;
    for (const auto& component : components) {
        current = derive_child(current, component.index, component.hardened, policy);
    }
    return current;
}

// Public parent to public child (non-hardened only).
//
// I = HMAC-SHA512(key = parent chain code, data = parent public key || ser32(i))
// child public key = IL * G + parent public key, child chain code = IR.
// Produces the same public key as deriving the private child and multiplying
// by G, which is what lets a watch-only holder enumerate addresses.
ExtendedPublicKey HdKey::derive_public_child(const ExtendedPublicKey& parent, uint32_t index, ChildPolicy policy) {
    return derive_public_child_with_mac(parent, index, policy, [&parent](uint32_t child_num) {
        std::vector<uint8_t> data(parent.key.begin(), parent.key.end());
        auto child_num_be = ser32(child_num);
        data.insert(data.end(), child_num_be.begin(), child_num_be.end());
        return HashUtils::hmac_sha512(parent.chaincode, data);
    });
}

ExtendedPublicKey HdKey::derive_public_child_with_mac(const ExtendedPublicKey& parent, uint32_t index,
                                                      ChildPolicy policy, const ChildMac& next_mac) {
    check_index(index);

    while (true) {
        auto mac = next_mac(index);
        std::span<const uint8_t> il(mac.data(), 32);

        if (Curve::is_valid_scalar(il)) {
            try {
                ExtendedPublicKey child;
                child.key = Curve::add_tweak(parent.key, il);
                std::copy_n(mac.begin() + 32, 32, child.chaincode.begin());
                child.depth = static_cast<uint8_t>(parent.depth + 1);
                child.parent_fingerprint = parent.fingerprint();
                child.child_number = index;
                return child;
            } catch (const DerivationError&) {
                if (policy == ChildPolicy::Surface) {
                    throw;
                }
            }
        } else if (policy == ChildPolicy::Surface) {
            throw DerivationError(DerivationError::ErrorType::ScalarOutOfRange,
                                  "Child index " + std::to_string(index) + " yields an invalid key");
        }

        if (index + 1 >= HARDENED_OFFSET) {
            throw DerivationError(DerivationError::ErrorType::InvalidPath,
                                  "No valid child key left after index " + std::to_string(index));
        }
        ++index;
    }
}

// Derives count sequential non-hardened children of an account-level key,
// e.g. the first N receive keys under m/44'/118'/0'/0
std::vector<ExtendedKey> HdKey::derive_children(const ExtendedKey& parent, uint32_t first, uint32_t count) {
    std::vector<ExtendedKey> keys;
    keys.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        keys.push_back(derive_child(parent, first + i, false));
    }
    return keys;
}

DerivationCache::DerivationCache(std::span<const uint8_t> seed, ChildPolicy policy, size_t capacity)
    : policy_(policy)
    , capacity_(capacity)
    , root_(HdKey::root_key(seed))
{}

// Looks up the path, or derives it from the deepest cached ancestor.
// Derivation runs without the lock; two threads racing on the same path
// compute identical keys and the first insert wins.
ExtendedKey DerivationCache::derive(const DerivationPath& path) {
    const auto& components = path.components();
    if (components.empty()) {
        return root_;
    }

    // prefixes[i] is the text of the path truncated to depth i + 1
    std::vector<std::string> prefixes;
    prefixes.reserve(components.size());
    std::string text = "m";
    for (const auto& component : components) {
        text += '/' + std::to_string(component.index) + (component.hardened ? "'" : "");
        prefixes.push_back(text);
    }

    ExtendedKey start = root_;
    size_t start_depth = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t depth = components.size(); depth > 0; --depth) {
            auto it = cache_.find(prefixes[depth - 1]);
            if (it != cache_.end()) {
                if (depth == components.size()) {
                    return it->second;
                }
                start = it->second;
                start_depth = depth;
                break;
            }
        }
    }

    ExtendedKey key = HdKey::derive_path(
        start, std::span<const DerivationPath::Component>(components).subspan(start_depth), policy_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (cache_.size() < capacity_) {
        cache_.emplace(prefixes.back(), key);
    }
    return key;
}

ExtendedKey DerivationCache::derive(std::string_view path) {
    return derive(DerivationPath::parse(path));
}

size_t DerivationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void DerivationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

} // namespace cosmkit
