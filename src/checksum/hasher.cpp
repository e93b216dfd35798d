#include "flowfile/checksum/hasher.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace flowfile::checksum {
namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string normalize(const std::string& algorithm) {
    const auto first = algorithm.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = algorithm.find_last_not_of(" \t\r\n");
    std::string out = algorithm.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

const EVP_MD* lookup_digest(const std::string& canonical) {
    if (canonical == "MD5") return EVP_md5();
    if (canonical == "SHA1") return EVP_sha1();
    if (canonical == "SHA224") return EVP_sha224();
    if (canonical == "SHA256") return EVP_sha256();
    if (canonical == "SHA384") return EVP_sha384();
    if (canonical == "SHA512") return EVP_sha512();
    return nullptr;
}

std::string to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace

std::string canonical_name(const std::string& algorithm) {
    const std::string upper = normalize(algorithm);
    if (upper == "SHA") {
        return "SHA1";
    }
    return lookup_digest(upper) != nullptr ? upper : std::string();
}

struct Hasher::Impl {
    const EVP_MD* md = nullptr;
    EvpMdCtxPtr ctx;
};

Hasher::Hasher(std::string algorithm, std::unique_ptr<Impl> impl)
    : algorithm_(std::move(algorithm))
    , impl_(std::move(impl)) {
}

Hasher::~Hasher() = default;

Result<std::unique_ptr<Hasher>> Hasher::create(const std::string& algorithm) {
    const std::string canonical = canonical_name(algorithm);
    if (canonical.empty()) {
        return Err<std::unique_ptr<Hasher>>(ErrorCode::UnknownChecksum,
            "Unable to find checksum type: \"" + algorithm + "\"");
    }

    auto impl = std::make_unique<Impl>();
    impl->md = lookup_digest(canonical);
    impl->ctx.reset(EVP_MD_CTX_new());
    if (!impl->ctx || EVP_DigestInit_ex(impl->ctx.get(), impl->md, nullptr) != 1) {
        return Err<std::unique_ptr<Hasher>>(ErrorCode::UnknownChecksum,
            "Digest initialisation failed for " + canonical);
    }
    return Ok(std::unique_ptr<Hasher>(new Hasher(canonical, std::move(impl))));
}

Result<void> Hasher::update(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return Ok();
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        return Err<void>(ErrorCode::UnknownChecksum, "EVP_DigestUpdate failed for " + algorithm_);
    }
    return Ok();
}

Result<void> Hasher::reset() {
    if (EVP_DigestInit_ex(impl_->ctx.get(), impl_->md, nullptr) != 1) {
        return Err<void>(ErrorCode::UnknownChecksum, "EVP_DigestInit_ex failed for " + algorithm_);
    }
    return Ok();
}

Result<std::string> Hasher::hex_digest() const {
    EvpMdCtxPtr copy(EVP_MD_CTX_new());
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), impl_->ctx.get()) != 1) {
        return Err<std::string>(ErrorCode::UnknownChecksum, "EVP_MD_CTX_copy_ex failed for " + algorithm_);
    }
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(copy.get(), out, &out_len) != 1) {
        return Err<std::string>(ErrorCode::UnknownChecksum, "EVP_DigestFinal_ex failed for " + algorithm_);
    }
    return Ok(to_hex(out, out_len));
}

Result<std::string> hash_bytes(const std::string& algorithm, const void* data, std::size_t len) {
    auto hasher = Hasher::create(algorithm);
    if (hasher.is_error()) {
        return Err<std::string>(hasher.error());
    }
    if (auto fed = hasher.value()->update(static_cast<const std::uint8_t*>(data), len); fed.is_error()) {
        return Err<std::string>(fed.error());
    }
    return hasher.value()->hex_digest();
}

} // namespace flowfile::checksum
