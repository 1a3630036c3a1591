#pragma once
#include <openssl/types.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ragcore::util {

// Unkeyed BLAKE2b through OpenSSL's BLAKE2B-512 digest with its output size
// set to 1..64 bytes. The size is part of the parameter block, so a short
// digest is not a prefix of the 64-byte one. Needs OpenSSL >= 3.2.
class Blake2b {
public:
    explicit Blake2b(size_t digest_length = 64);

    void update(const void* data, size_t len);
    std::vector<uint8_t> final();

    static std::vector<uint8_t> digest(const std::string& data, size_t digest_length);

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    size_t digest_length_;
    bool finalized_ = false;
};

} // namespace ragcore::util
