#include "crypto.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/buffer.h>
#include <openssl/bio.h>
#include <openssl/hmac.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <cstdint>
#include <ctime>

static const size_t kKeyLen = 32;
static const size_t kIvLen = 16;
static const size_t kMacLen = 32;
static const size_t kHeaderLen = 1 + 8 + kIvLen;
static const unsigned char kVersion = 0x80;

std::string base64_encode(const std::string& in){
    BIO *bio, *b64; BUF_MEM *bufferPtr;
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, bio);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, in.data(), (int)in.size());
    BIO_flush(b64);
    BIO_get_mem_ptr(b64, &bufferPtr);
    std::string out(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);
    return out;
}

std::string base64_decode(const std::string& in){
    BIO *bio, *b64;
    int len = (int)in.size();
    std::string out; out.resize(len);
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new_mem_buf(in.data(), len);
    b64 = BIO_push(b64, bio);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    int outlen = BIO_read(b64, &out[0], len);
    BIO_free_all(b64);
    if (outlen < 0) outlen = 0;
    out.resize(outlen);
    return out;
}

std::string base64url_encode(const std::string& in){
    std::string s = base64_encode(in);
    std::replace(s.begin(), s.end(), '+', '-');
    std::replace(s.begin(), s.end(), '/', '_');
    return s;
}

std::string base64url_decode(const std::string& in){
    if (in.empty()) return {};
    if (in.size() % 4 != 0) throw CryptoError("base64 length is not a multiple of 4");
    std::string s = in;
    size_t pad = 0;
    for (size_t i = 0; i < s.size(); ++i){
        char& c = s[i];
        if (c == '=') {
            if (i < s.size() - 2) throw CryptoError("misplaced base64 padding");
            ++pad;
            continue;
        }
        if (pad) throw CryptoError("misplaced base64 padding");
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (!((c>='A'&&c<='Z') || (c>='a'&&c<='z') || (c>='0'&&c<='9')))
            throw CryptoError("invalid base64 character");
    }
    std::string out = base64_decode(s);
    if (out.size() != s.size() / 4 * 3 - pad) throw CryptoError("invalid base64 data");
    return out;
}

std::string sha256(const std::string& in){
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0;
    if (EVP_Digest(in.data(), in.size(), md, &mdlen, EVP_sha256(), nullptr) != 1)
        throw CryptoError("SHA-256 digest failed");
    return std::string(reinterpret_cast<const char*>(md), mdlen);
}

static std::string hmac_sha256(const std::string& key, const std::string& data){
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int maclen = 0;
    if (!HMAC(EVP_sha256(), key.data(), (int)key.size(),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac, &maclen))
        throw CryptoError("HMAC-SHA256 failed");
    return std::string(reinterpret_cast<const char*>(mac), maclen);
}

static std::string decode_key(const std::string& key){
    std::string raw;
    try {
        raw = base64url_decode(key);
    } catch (const CryptoError&){
        throw CryptoError("key is not url-safe base64; provide a valid Fernet key");
    }
    if (raw.size() != kKeyLen) throw CryptoError("Fernet key must be 32 url-safe base64-encoded bytes");
    return raw;
}

std::string FernetCipher::encrypt(const std::string& plaintext, const std::string& key) const {
    if (plaintext.empty()) throw CryptoError("refusing to encrypt an empty value");
    std::string raw = decode_key(key);
    std::string signing_key = raw.substr(0, 16);
    std::string enc_key = raw.substr(16);

    unsigned char iv[kIvLen];
    if (RAND_bytes(iv, sizeof(iv)) != 1) throw CryptoError("RAND_bytes iv failed");

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");
    int rc = EVP_EncryptInit_ex(ctx, EVP_aes_128_cbc(), nullptr,
                                reinterpret_cast<const unsigned char*>(enc_key.data()), iv);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("EncryptInit failed"); }

    std::vector<unsigned char> out(plaintext.size()+16);
    int outlen1=0, outlen2=0;
    rc = EVP_EncryptUpdate(ctx, out.data(), &outlen1, reinterpret_cast<const unsigned char*>(plaintext.data()), (int)plaintext.size());
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("EncryptUpdate failed"); }
    rc = EVP_EncryptFinal_ex(ctx, out.data()+outlen1, &outlen2);
    EVP_CIPHER_CTX_free(ctx);
    if (rc != 1) throw CryptoError("EncryptFinal failed");

    std::string body;
    body.reserve(kHeaderLen + outlen1 + outlen2 + kMacLen);
    body.push_back((char)kVersion);
    uint64_t ts = (uint64_t)std::time(nullptr);
    for (int i = 7; i >= 0; --i) body.push_back((char)((ts >> (i*8)) & 0xFF));
    body.append(reinterpret_cast<const char*>(iv), sizeof(iv));
    body.append(reinterpret_cast<const char*>(out.data()), outlen1 + outlen2);
    body += hmac_sha256(signing_key, body);
    return base64url_encode(body);
}

std::string FernetCipher::decrypt(const std::string& token, const std::string& key) const {
    std::string raw = decode_key(key);
    std::string signing_key = raw.substr(0, 16);
    std::string enc_key = raw.substr(16);

    std::string body;
    try {
        body = base64url_decode(token);
    } catch (const CryptoError&){
        throw CryptoError("token is not url-safe base64");
    }
    if (body.size() < kHeaderLen + 16 + kMacLen) throw CryptoError("token too short");
    if ((unsigned char)body[0] != kVersion) throw CryptoError("unsupported token version");
    size_t ctlen = body.size() - kHeaderLen - kMacLen;
    if (ctlen % 16 != 0) throw CryptoError("token payload is not block aligned");

    std::string signed_part = body.substr(0, body.size() - kMacLen);
    std::string mac = hmac_sha256(signing_key, signed_part);
    if (CRYPTO_memcmp(mac.data(), body.data() + signed_part.size(), kMacLen) != 0)
        throw CryptoError("token authentication failed (wrong key or corrupted value)");

    const unsigned char* iv = reinterpret_cast<const unsigned char*>(body.data()) + 9;
    const unsigned char* ct = reinterpret_cast<const unsigned char*>(body.data()) + kHeaderLen;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");
    int rc = EVP_DecryptInit_ex(ctx, EVP_aes_128_cbc(), nullptr,
                                reinterpret_cast<const unsigned char*>(enc_key.data()), iv);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("DecryptInit failed"); }

    std::string out; out.resize(ctlen + 16);
    int outlen1=0, outlen2=0;
    rc = EVP_DecryptUpdate(ctx, reinterpret_cast<unsigned char*>(&out[0]), &outlen1, ct, (int)ctlen);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError("DecryptUpdate failed"); }
    rc = EVP_DecryptFinal_ex(ctx, reinterpret_cast<unsigned char*>(&out[0]) + outlen1, &outlen2);
    EVP_CIPHER_CTX_free(ctx);
    if (rc != 1) throw CryptoError("DecryptFinal padding check failed");

    out.resize(outlen1 + outlen2);
    return out;
}

std::string FernetCipher::generate_key(){
    unsigned char key[kKeyLen];
    if (RAND_bytes(key, sizeof(key)) != 1) throw CryptoError("RAND_bytes key failed");
    return base64url_encode(std::string(reinterpret_cast<const char*>(key), sizeof(key)));
}
