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

#pragma once

#include <QByteArray>
#include <QString>

#include <optional>

/**
 * @brief Field level authenticated encryption for the vault file.
 *
 * The key is derived from the caller's passphrase with PBKDF2-HMAC-SHA256 over
 * a random per-vault salt. Each field is sealed with AES-256-GCM under a fresh
 * random IV. Blob layout:
 *
 *     version (1 byte) | iv (12 bytes) | ciphertext | tag (16 bytes)
 *
 * The caller binds a context label (the column name) as additional
 * authenticated data, so a blob copied into another column fails to open.
 * Key bytes are wiped when the cipher is destroyed and never leave the object.
 */
class VaultCipher
{
public:
    static constexpr int kSaltLength = 16;
    static constexpr int kIvLength = 12;
    static constexpr int kTagLength = 16;
    static constexpr int kKeyLength = 32;
    static constexpr char kFormatVersion = 1;
    static constexpr int kDefaultIterations = 200000;

    VaultCipher(const QString& passphrase, const QByteArray& salt, int iterations);
    ~VaultCipher();

    VaultCipher(const VaultCipher&) = delete;
    VaultCipher& operator=(const VaultCipher&) = delete;

    static QByteArray generateSalt();

    /// Seals plaintext. Throws StorageError if the crypto library fails.
    QByteArray encrypt(const QByteArray& plaintext, const QByteArray& context) const;

    /// Opens a sealed blob; std::nullopt when authentication fails.
    std::optional<QByteArray> decrypt(const QByteArray& blob, const QByteArray& context) const;

    QByteArray encryptText(const QString& text, const QByteArray& context) const;

    /// Throws VaultAccessError when the blob does not authenticate.
    QString decryptText(const QByteArray& blob, const QByteArray& context) const;

    // Key-check blob stored beside the salt; opening it proves the passphrase.
    QByteArray makeKeyCheck() const;
    bool verifyKeyCheck(const QByteArray& blob) const;

private:
    unsigned char m_key[kKeyLength];
};
