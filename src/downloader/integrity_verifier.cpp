/*
 * mlget/src/downloader/integrity_verifier.cpp
 *
 * Streaming IntegrityVerifier on OpenSSL EVP.
 * - MD5, SHA-1 and the SHA-2 family map to the built-in EVP digests.
 * - MD2 is looked up by name at runtime; builds without it report UnsupportedAlgorithm.
 * - SHAKE128/SHAKE256 are rejected in reset() with UnsupportedAlgorithm.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <mlget/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace mlget::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md2:
            return EVP_get_digestbyname("MD2");
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha1:
            return EVP_sha1();
        case HashAlgo::Sha224:
            return EVP_sha224();
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha384:
            return EVP_sha384();
        case HashAlgo::Sha512:
            return EVP_sha512();
        case HashAlgo::Shake128:
        case HashAlgo::Shake256:
            return nullptr;
    }
    return nullptr;
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    ~OpenSslIntegrityVerifier() override = default;

    Result<void> reset(HashAlgo algo) override {
        _algo = algo;
        _ready = false;
        _ctx = EvpMdCtx{};

        const EVP_MD* md = resolve_algo(algo);
        if (!md) {
            return Error{ErrorCode::UnsupportedAlgorithm,
                         "No digest implementation for " + std::string(hashAlgoName(algo))};
        }
        if (!_ctx) {
            return Error{ErrorCode::InternalError, "EVP_MD_CTX_new failed"};
        }
        if (EVP_DigestInit_ex(_ctx.ctx, md, nullptr) != 1) {
            // Legacy digests (MD2) are present by name but refused by the default provider
            return Error{ErrorCode::UnsupportedAlgorithm,
                         "Digest initialization failed for " + std::string(hashAlgoName(algo))};
        }
        _ready = true;
        return {};
    }

    void update(ByteSpan data) override {
        if (!_ready || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            _failed = true;
        }
    }

    Result<std::string> finalize() override {
        if (!_ready) {
            return Error{ErrorCode::InternalError, "Integrity verifier is not initialized"};
        }
        _ready = false;
        if (_failed) {
            _failed = false;
            return Error{ErrorCode::InternalError, "EVP_DigestUpdate failed"};
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            return Error{ErrorCode::InternalError, "EVP_DigestFinal_ex failed"};
        }
        return to_hex_lower(md_buf.data(), md_len);
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    EvpMdCtx _ctx{};
    bool _ready{false};
    bool _failed{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

} // namespace mlget::downloader
