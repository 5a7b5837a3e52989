/*
 * geofetch/src/downloader/integrity_verifier.cpp
 *
 * Streaming SHA-256 over OpenSSL EVP.
 * - update() is fed every body chunk as it is written to the staged artifact
 * - finalize() yields a lower-case hex Checksum and re-arms the context for the next attempt
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <geofetch/downloader/downloader.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace geofetch::downloader {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(len * 2, '\0');
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = kHex[(bytes[i] >> 4) & 0xF];
        out[2 * i + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    OpenSslIntegrityVerifier() { reset(HashAlgo::Sha256); }

    void reset(HashAlgo algo) override {
        _algo = algo;
        _ctx.reset(EVP_MD_CTX_new());
        if (!_ctx || EVP_DigestInit_ex(_ctx.get(), EVP_sha256(), nullptr) != 1) {
            spdlog::error("SHA-256 context initialization failed");
            _ctx.reset();
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.get(), data.data(), data.size()) != 1) {
            spdlog::error("SHA-256 update failed");
            _ctx.reset();
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;
        if (_ctx) {
            std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
            unsigned len = 0;
            if (EVP_DigestFinal_ex(_ctx.get(), md.data(), &len) == 1) {
                out.hex = to_hex_lower(md.data(), len);
            }
        }
        // An empty hex digest marks a failed computation
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    EvpMdCtxPtr _ctx;
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

} // namespace geofetch::downloader
