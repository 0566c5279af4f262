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

#include "RagUtils.h"

#include <QtEndian>

#include <algorithm>
#include <cmath>
#include <cstring>

using namespace std;

double RagUtils::cosineSimilarity(const vector<float>& a, const vector<float>& b)
{
    if (a.empty() || b.empty() || a.size() != b.size()) {
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        const double va = a[i];
        const double vb = b[i];
        dot += va * vb;
        normA += va * va;
        normB += vb * vb;
    }

    if (normA == 0.0 || normB == 0.0) {
        return 0.0;
    }

    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

double RagUtils::relevanceScore(const vector<float>& a, const vector<float>& b)
{
    return std::clamp(cosineSimilarity(a, b), 0.0, 1.0);
}

QByteArray RagUtils::vectorToBlob(const vector<float>& vec)
{
    QByteArray blob(static_cast<int>(vec.size() * sizeof(quint32)), Qt::Uninitialized);
    char* out = blob.data();
    for (size_t i = 0; i < vec.size(); ++i) {
        quint32 bits = 0;
        std::memcpy(&bits, &vec[i], sizeof(bits));
        qToLittleEndian(bits, out + i * sizeof(bits));
    }
    return blob;
}

vector<float> RagUtils::blobToVector(const QByteArray& blob)
{
    vector<float> result;
    if (blob.isEmpty() || blob.size() % static_cast<int>(sizeof(quint32)) != 0) {
        return result;
    }

    const int count = blob.size() / static_cast<int>(sizeof(quint32));
    result.resize(count);
    const char* in = blob.constData();
    for (int i = 0; i < count; ++i) {
        const quint32 bits = qFromLittleEndian<quint32>(in + i * sizeof(quint32));
        std::memcpy(&result[i], &bits, sizeof(bits));
    }
    return result;
}
