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

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every error raised by the vault core.
 *
 * Errors are configuration or I/O failures. "No results" is never an error.
 */
class VaultError : public std::runtime_error {
public:
    explicit VaultError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Wrong passphrase or a key-check blob that fails authentication.
 */
class VaultAccessError : public VaultError {
public:
    explicit VaultAccessError(const std::string& message)
        : VaultError(message) {}
};

/**
 * @brief Raised by any storage operation attempted before open() succeeded.
 */
class VaultNotOpenError : public VaultError {
public:
    explicit VaultNotOpenError(const std::string& message)
        : VaultError(message) {}
};

/**
 * @brief A chunk vector whose width disagrees with the store-wide dimension.
 */
class DimensionMismatchError : public VaultError {
public:
    DimensionMismatchError(int expected, int actual, const std::string& where)
        : VaultError("Embedding dimension mismatch (" + where + "): expected "
                     + std::to_string(expected) + ", got " + std::to_string(actual))
        , m_expected(expected)
        , m_actual(actual) {}

    int expected() const { return m_expected; }
    int actual() const { return m_actual; }

private:
    int m_expected;
    int m_actual;
};

// Strict initialize() without a usable similarity index.
class IndexUnavailableError : public VaultError {
public:
    explicit IndexUnavailableError(const std::string& message)
        : VaultError(message) {}
};

// SQL, transaction or file level failure.
class StorageError : public VaultError {
public:
    explicit StorageError(const std::string& message)
        : VaultError(message) {}
};

/**
 * @brief The embedding or generation collaborator has no model loaded.
 */
class ModelNotLoadedError : public VaultError {
public:
    explicit ModelNotLoadedError(const std::string& message)
        : VaultError(message) {}
};

class BackendError : public VaultError {
public:
    explicit BackendError(const std::string& message)
        : VaultError(message) {}
};
