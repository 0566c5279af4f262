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

#include <gtest/gtest.h>
#include "core/VaultCipher.h"
#include "VaultErrors.h"

namespace {

const QByteArray kSalt = QByteArrayLiteral("0123456789abcdef");
constexpr int kIterations = 1000;

} // namespace

TEST(VaultCipherTest, RoundTripsWithMatchingContext) {
    VaultCipher cipher(QStringLiteral("correct horse"), kSalt, kIterations);

    const QByteArray blob = cipher.encryptText(QStringLiteral("Dock 7 for trucks"), "chunks.content");
    EXPECT_EQ(cipher.decryptText(blob, "chunks.content"), QStringLiteral("Dock 7 for trucks"));
}

TEST(VaultCipherTest, BlobLayoutHasVersionIvAndTag) {
    VaultCipher cipher(QStringLiteral("pw"), kSalt, kIterations);
    const QByteArray plain = QByteArrayLiteral("twelve bytes");

    const QByteArray blob = cipher.encrypt(plain, "documents.content");

    EXPECT_EQ(blob.size(), 1 + VaultCipher::kIvLength + plain.size() + VaultCipher::kTagLength);
    EXPECT_EQ(blob.at(0), VaultCipher::kFormatVersion);
    EXPECT_FALSE(blob.contains(plain));
}

TEST(VaultCipherTest, FreshIvPerEncryption) {
    VaultCipher cipher(QStringLiteral("pw"), kSalt, kIterations);

    const QByteArray a = cipher.encrypt("same", "ctx");
    const QByteArray b = cipher.encrypt("same", "ctx");
    EXPECT_NE(a, b);
    EXPECT_EQ(*cipher.decrypt(a, "ctx"), QByteArray("same"));
    EXPECT_EQ(*cipher.decrypt(b, "ctx"), QByteArray("same"));
}

TEST(VaultCipherTest, EmptyPlaintextRoundTrips) {
    VaultCipher cipher(QStringLiteral("pw"), kSalt, kIterations);

    const auto plain = cipher.decrypt(cipher.encrypt(QByteArray(), "ctx"), "ctx");
    ASSERT_TRUE(plain.has_value());
    EXPECT_TRUE(plain->isEmpty());
}

TEST(VaultCipherTest, WrongPassphraseFailsAuthentication) {
    VaultCipher right(QStringLiteral("A"), kSalt, kIterations);
    VaultCipher wrong(QStringLiteral("B"), kSalt, kIterations);

    const QByteArray blob = right.encryptText(QStringLiteral("secret"), "documents.title");

    EXPECT_FALSE(wrong.decrypt(blob, "documents.title").has_value());
    EXPECT_THROW(wrong.decryptText(blob, "documents.title"), VaultAccessError);
}

TEST(VaultCipherTest, ContextIsAuthenticated) {
    VaultCipher cipher(QStringLiteral("pw"), kSalt, kIterations);
    const QByteArray blob = cipher.encrypt("payload", "documents.title");

    EXPECT_FALSE(cipher.decrypt(blob, "documents.content").has_value());
}

TEST(VaultCipherTest, TamperedOrTruncatedBlobIsRejected) {
    VaultCipher cipher(QStringLiteral("pw"), kSalt, kIterations);
    QByteArray blob = cipher.encrypt("payload", "ctx");

    QByteArray flipped = blob;
    flipped[1 + VaultCipher::kIvLength] = static_cast<char>(flipped.at(1 + VaultCipher::kIvLength) ^ 0x01);
    EXPECT_FALSE(cipher.decrypt(flipped, "ctx").has_value());

    EXPECT_FALSE(cipher.decrypt(blob.left(10), "ctx").has_value());

    QByteArray badVersion = blob;
    badVersion[0] = 9;
    EXPECT_FALSE(cipher.decrypt(badVersion, "ctx").has_value());
}

TEST(VaultCipherTest, KeyCheckIdentifiesPassphrase) {
    VaultCipher owner(QStringLiteral("A"), kSalt, kIterations);
    VaultCipher sameKey(QStringLiteral("A"), kSalt, kIterations);
    VaultCipher other(QStringLiteral("B"), kSalt, kIterations);

    const QByteArray check = owner.makeKeyCheck();
    EXPECT_TRUE(sameKey.verifyKeyCheck(check));
    EXPECT_FALSE(other.verifyKeyCheck(check));
}

TEST(VaultCipherTest, SaltMustBeSixteenBytes) {
    const QByteArray salt = VaultCipher::generateSalt();
    EXPECT_EQ(salt.size(), VaultCipher::kSaltLength);
    EXPECT_NE(salt, VaultCipher::generateSalt());

    EXPECT_THROW(VaultCipher(QStringLiteral("pw"), QByteArray("short"), kIterations), VaultAccessError);
    EXPECT_THROW(VaultCipher(QStringLiteral("pw"), kSalt, 0), VaultAccessError);
}
