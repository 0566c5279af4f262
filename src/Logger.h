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

#include <QString>
#include <QDebug>

#include <functional>

class AppLogHelper {
public:
    using Sink = std::function<void(const QString& message, bool isWarning)>;

    AppLogHelper(bool isWarn);
    ~AppLogHelper();
    QDebug stream() { return QDebug(&m_buffer).nospace(); }

    static void setGlobalDebugEnabled(bool enabled);
    static bool isGlobalDebugEnabled();

    // Replaces the default qDebug/qWarning routing. Pass an empty sink to restore it.
    static void setSink(Sink sink);

private:
    QString m_buffer;
    bool m_isWarn;
    static bool s_globalDebugEnabled;
};

#define KV_LOG AppLogHelper(false).stream()
#define KV_WARN AppLogHelper(true).stream()
#define KV_CLOG(category) (AppLogHelper(false).stream() << "[" #category "] ")
