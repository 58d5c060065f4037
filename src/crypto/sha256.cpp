// ZKANCHOR - SHA256 Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/crypto/sha256.h"

#include "zkanchor/core/errors.h"

#include <openssl/evp.h>

namespace zkanchor {

class SHA256::Impl {
public:
    Impl() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            throw Error("sha256: EVP_MD_CTX_new failed");
        }
        Init();
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx_);
    }

    void Init() {
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            throw Error("sha256: EVP_DigestInit_ex failed");
        }
    }

    void Update(const Byte* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw Error("sha256: EVP_DigestUpdate failed");
        }
    }

    void Final(Byte* out) {
        unsigned int outLen = 0;
        if (EVP_DigestFinal_ex(ctx_, out, &outLen) != 1 ||
            outLen != SHA256::OUTPUT_SIZE) {
            throw Error("sha256: EVP_DigestFinal_ex failed");
        }
    }

private:
    EVP_MD_CTX* ctx_;
};

SHA256::SHA256() : impl_(new Impl()) {}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    impl_->Update(data, len);
    return *this;
}

SHA256& SHA256::Write(const std::string& data) {
    impl_->Update(reinterpret_cast<const Byte*>(data.data()), data.size());
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    impl_->Final(hash);
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

Sha256Digest SHA256Hash(const Byte* data, size_t len) {
    Sha256Digest digest;
    SHA256().Write(data, len).Finalize(digest.data());
    return digest;
}

} // namespace zkanchor
