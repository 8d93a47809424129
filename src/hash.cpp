#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <system_error>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

void check_evp(int rc, const char* key) {
    if (rc != 1) {
        throw DotsyncException(get_string(key));
    }
}

} // anonymous namespace

Sha256Digest sha256_digest(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw DotsyncException(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw DotsyncException(get_string("error.openssl_ctx_failed"));
    }
    check_evp(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr), "error.openssl_init_failed");

    char buffer[16384];
    do {
        file.read(buffer, sizeof(buffer));
        if (file.bad()) {
            throw DotsyncException(string_format("error.open_file_failed", file_path.string()));
        }
        check_evp(EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())), "error.openssl_update_failed");
    } while (file);

    Sha256Digest digest{};
    unsigned int length = 0;
    check_evp(EVP_DigestFinal_ex(ctx.get(), digest.data(), &length), "error.openssl_final_failed");
    if (length != digest.size()) {
        throw DotsyncException(get_string("error.openssl_final_failed"));
    }
    return digest;
}

std::string calculate_sha256(const std::filesystem::path& file_path) {
    static constexpr char HEX[] = "0123456789abcdef";
    const Sha256Digest digest = sha256_digest(file_path);

    std::string text;
    text.reserve(digest.size() * 2);
    for (unsigned char byte : digest) {
        text += HEX[byte >> 4];
        text += HEX[byte & 0x0f];
    }
    return text;
}

bool same_content(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec_a, ec_b;
    const auto size_a = std::filesystem::file_size(a, ec_a);
    const auto size_b = std::filesystem::file_size(b, ec_b);
    if (ec_a || ec_b || size_a != size_b) {
        return false;
    }
    return sha256_digest(a) == sha256_digest(b);
}
