// File: secure_bytes.hpp
// Brief: Locked, self-erasing byte buffer for seeds and private scalars
//
// - The pages are locked so the secret is not swapped to disk
// - The buffer is cleansed before it is released
// - Copies must be made explicitly with clone()

#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <openssl/crypto.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#endif

namespace cosmkit {

class SecureBytes {
private:
    uint8_t* data_;
    size_t size_;

    void lock() {
        #ifdef _WIN32
        VirtualLock(data_, size_);
        #else
        // mlock can fail without CAP_IPC_LOCK or under RLIMIT_MEMLOCK; the
        // buffer is still erased on release
        (void)mlock(data_, size_);
        #endif
    }

    void release() {
        if (data_) {
            OPENSSL_cleanse(data_, size_);
            #ifdef _WIN32
            VirtualUnlock(data_, size_);
            #else
            munlock(data_, size_);
            #endif
            delete[] data_;
            data_ = nullptr;
            size_ = 0;
        }
    }

public:
    // Zero-filled buffer of the given size
    explicit SecureBytes(size_t length) : data_(new uint8_t[length]()), size_(length) {
        lock();
    }

    SecureBytes(const uint8_t* input, size_t length) : data_(new uint8_t[length]), size_(length) {
        std::memcpy(data_, input, size_);
        lock();
    }

    explicit SecureBytes(std::span<const uint8_t> input) : SecureBytes(input.data(), input.size()) {}

    ~SecureBytes() { release(); }

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept : data_(other.data_), size_(other.size_) {
        other.data_ = nullptr;
        other.size_ = 0;
    }

    SecureBytes& operator=(SecureBytes&& other) noexcept {
        if (this != &other) {
            release();
            data_ = other.data_;
            size_ = other.size_;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    SecureBytes clone() const { return SecureBytes(data_, size_); }

    const uint8_t* data() const { return data_; }
    uint8_t* data() { return data_; }
    size_t size() const { return size_; }
    std::span<const uint8_t> span() const { return {data_, size_}; }

    bool empty() const { return size_ == 0 || data_ == nullptr; }
};

} // namespace cosmkit
