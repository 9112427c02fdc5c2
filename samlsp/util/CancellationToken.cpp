/**
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * util/CancellationToken.cpp
 *
 * Cooperative cancellation of blocking operations.
 */

#include "internal.h"
#include "util/CancellationToken.h"

using namespace samlsp;
using namespace std;

CancellationToken::CancellationToken() : m_cancelled(false)
{
}

CancellationToken::~CancellationToken()
{
}

void CancellationToken::cancel()
{
    {
        lock_guard<mutex> locker(m_lock);
        m_cancelled = true;
    }
    m_cancel_wait.notify_all();
}

bool CancellationToken::isCancelled() const
{
    lock_guard<mutex> locker(m_lock);
    return m_cancelled;
}

bool CancellationToken::waitFor(chrono::milliseconds interval) const
{
    unique_lock<mutex> lock(m_lock);
    return !m_cancel_wait.wait_for(lock, interval, [this] { return m_cancelled; });
}
