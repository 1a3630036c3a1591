#include "util/blake2b.hpp"
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <stdexcept>

namespace ragcore::util {

namespace {

std::string openssl_error(const std::string& what) {
    unsigned long code = ERR_get_error();
    if (code == 0) return what;
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return what + ": " + buf;
}

struct MdDeleter {
    void operator()(EVP_MD* md) const { EVP_MD_free(md); }
};

} // namespace

void Blake2b::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Blake2b::Blake2b(size_t digest_length) : digest_length_(digest_length) {
    if (digest_length_ == 0 || digest_length_ > 64) {
        throw std::invalid_argument("BLAKE2b digest length must be in 1..64, got " +
                                    std::to_string(digest_length_));
    }

    std::unique_ptr<EVP_MD, MdDeleter> md(EVP_MD_fetch(nullptr, "BLAKE2B-512", nullptr));
    if (!md) {
        throw std::runtime_error(openssl_error("OpenSSL does not provide BLAKE2B-512"));
    }

    ctx_.reset(EVP_MD_CTX_new());
    if (!ctx_) {
        throw std::runtime_error(openssl_error("EVP_MD_CTX_new failed"));
    }

    size_t size = digest_length_;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_size_t(OSSL_DIGEST_PARAM_SIZE, &size),
        OSSL_PARAM_construct_end()
    };
    if (EVP_DigestInit_ex2(ctx_.get(), md.get(), params) != 1) {
        throw std::runtime_error(openssl_error(
            "Cannot initialise BLAKE2b with a " + std::to_string(digest_length_) +
            "-byte digest (settable digest size needs OpenSSL 3.2 or newer)"));
    }
}

void Blake2b::update(const void* data, size_t len) {
    if (finalized_) throw std::logic_error("Blake2b::update called after final()");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestUpdate failed"));
    }
}

std::vector<uint8_t> Blake2b::final() {
    if (finalized_) throw std::logic_error("Blake2b::final called twice");
    finalized_ = true;

    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int written = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &written) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestFinal_ex failed"));
    }
    if (written != digest_length_) {
        throw std::runtime_error("BLAKE2b produced " + std::to_string(written) +
                                 " bytes, expected " + std::to_string(digest_length_));
    }
    out.resize(written);
    return out;
}

std::vector<uint8_t> Blake2b::digest(const std::string& data, size_t digest_length) {
    Blake2b hasher(digest_length);
    hasher.update(data.data(), data.size());
    return hasher.final();
}

} // namespace ragcore::util
