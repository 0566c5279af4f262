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

#include "Logger.h"

#include <QMutex>
#include <QMutexLocker>

bool AppLogHelper::s_globalDebugEnabled = false;

namespace {

QMutex& sinkMutex()
{
    static QMutex mutex;
    return mutex;
}

AppLogHelper::Sink& sinkSlot()
{
    static AppLogHelper::Sink sink;
    return sink;
}

} // namespace

AppLogHelper::AppLogHelper(bool isWarn)
    : m_isWarn(isWarn)
{
}

void AppLogHelper::setGlobalDebugEnabled(bool enabled)
{
    s_globalDebugEnabled = enabled;
}

bool AppLogHelper::isGlobalDebugEnabled()
{
    return s_globalDebugEnabled;
}

void AppLogHelper::setSink(Sink sink)
{
    QMutexLocker locker(&sinkMutex());
    sinkSlot() = std::move(sink);
}

AppLogHelper::~AppLogHelper()
{
    if (!m_isWarn && !s_globalDebugEnabled) {
        return;
    }

    {
        QMutexLocker locker(&sinkMutex());
        if (sinkSlot()) {
            sinkSlot()(m_buffer, m_isWarn);
            return;
        }
    }

    // Default routing: warnings always reach the console, debug output only
    // when global debug is enabled.
    if (m_isWarn) {
        qWarning().noquote() << m_buffer;
    } else {
        qDebug().noquote() << m_buffer;
    }
}
