//
// Knowledge Vault
//
// Copyright (c) 2025 Adrian Sutherland
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#include "VaultCipher.h"

#include "VaultErrors.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstring>
#include <memory>
#include <vector>

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

const QByteArray kKeyCheckPlaintext = QByteArrayLiteral("knowledge-vault-key-check");
const QByteArray kKeyCheckContext = QByteArrayLiteral("vault_meta.key_check");

} // namespace

VaultCipher::VaultCipher(const QString& passphrase, const QByteArray& salt, int iterations)
{
    if (salt.size() != kSaltLength) {
        throw VaultAccessError("Vault salt is missing or malformed");
    }
    if (iterations <= 0) {
        throw VaultAccessError("Vault key derivation iteration count is invalid");
    }

    QByteArray secret = passphrase.toUtf8();
    const int ok = PKCS5_PBKDF2_HMAC(secret.constData(), secret.size(),
                                     reinterpret_cast<const unsigned char*>(salt.constData()),
                                     salt.size(), iterations, EVP_sha256(),
                                     kKeyLength, m_key);
    OPENSSL_cleanse(secret.data(), static_cast<size_t>(secret.size()));
    if (ok != 1) {
        OPENSSL_cleanse(m_key, sizeof(m_key));
        throw StorageError("Key derivation failed");
    }
}

VaultCipher::~VaultCipher()
{
    OPENSSL_cleanse(m_key, sizeof(m_key));
}

QByteArray VaultCipher::generateSalt()
{
    QByteArray salt(kSaltLength, Qt::Uninitialized);
    if (RAND_bytes(reinterpret_cast<unsigned char*>(salt.data()), kSaltLength) != 1) {
        throw StorageError("Random generator failed while creating vault salt");
    }
    return salt;
}

QByteArray VaultCipher::encrypt(const QByteArray& plaintext, const QByteArray& context) const
{
    unsigned char iv[kIvLength];
    if (RAND_bytes(iv, kIvLength) != 1) {
        throw StorageError("Random generator failed while creating IV");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw StorageError("Unable to allocate cipher context");
    }

    std::vector<unsigned char> out(static_cast<size_t>(plaintext.size()) + kTagLength);
    unsigned char tag[kTagLength];
    int len = 0;
    int total = 0;

    bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLength, nullptr) == 1;
    ok = ok && EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, m_key, iv) == 1;
    if (ok && !context.isEmpty()) {
        ok = EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                               reinterpret_cast<const unsigned char*>(context.constData()),
                               context.size()) == 1;
    }
    if (ok && !plaintext.isEmpty()) {
        ok = EVP_EncryptUpdate(ctx.get(), out.data(), &len,
                               reinterpret_cast<const unsigned char*>(plaintext.constData()),
                               plaintext.size()) == 1;
        total = len;
    }
    ok = ok && EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) == 1;
    total += ok ? len : 0;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLength, tag) == 1;

    if (!ok) {
        throw StorageError("Field encryption failed");
    }

    QByteArray blob;
    blob.reserve(1 + kIvLength + total + kTagLength);
    blob.append(kFormatVersion);
    blob.append(reinterpret_cast<const char*>(iv), kIvLength);
    blob.append(reinterpret_cast<const char*>(out.data()), total);
    blob.append(reinterpret_cast<const char*>(tag), kTagLength);
    return blob;
}

std::optional<QByteArray> VaultCipher::decrypt(const QByteArray& blob, const QByteArray& context) const
{
    if (blob.size() < 1 + kIvLength + kTagLength || blob.at(0) != kFormatVersion) {
        return std::nullopt;
    }

    const auto* raw = reinterpret_cast<const unsigned char*>(blob.constData());
    const unsigned char* iv = raw + 1;
    const int cipherLength = blob.size() - 1 - kIvLength - kTagLength;
    const unsigned char* cipherText = iv + kIvLength;
    unsigned char tag[kTagLength];
    std::memcpy(tag, cipherText + cipherLength, kTagLength);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return std::nullopt;
    }

    std::vector<unsigned char> out(static_cast<size_t>(cipherLength) + kTagLength);
    int len = 0;
    int total = 0;

    bool ok = EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLength, nullptr) == 1;
    ok = ok && EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, m_key, iv) == 1;
    if (ok && !context.isEmpty()) {
        ok = EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                               reinterpret_cast<const unsigned char*>(context.constData()),
                               context.size()) == 1;
    }
    if (ok && cipherLength > 0) {
        ok = EVP_DecryptUpdate(ctx.get(), out.data(), &len, cipherText, cipherLength) == 1;
        total = len;
    }
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLength, tag) == 1;
    ok = ok && EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) == 1;

    if (!ok) {
        OPENSSL_cleanse(out.data(), out.size());
        return std::nullopt;
    }
    total += len;

    QByteArray plain(reinterpret_cast<const char*>(out.data()), total);
    OPENSSL_cleanse(out.data(), out.size());
    return plain;
}

QByteArray VaultCipher::encryptText(const QString& text, const QByteArray& context) const
{
    return encrypt(text.toUtf8(), context);
}

QString VaultCipher::decryptText(const QByteArray& blob, const QByteArray& context) const
{
    const auto plain = decrypt(blob, context);
    if (!plain) {
        throw VaultAccessError("Failed to authenticate encrypted field '"
                               + context.toStdString() + "'");
    }
    return QString::fromUtf8(*plain);
}

QByteArray VaultCipher::makeKeyCheck() const
{
    return encrypt(kKeyCheckPlaintext, kKeyCheckContext);
}

bool VaultCipher::verifyKeyCheck(const QByteArray& blob) const
{
    const auto plain = decrypt(blob, kKeyCheckContext);
    return plain && *plain == kKeyCheckPlaintext;
}
