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
 * @file samlsp/util/CancellationToken.h
 *
 * Cooperative cancellation of blocking operations.
 */

#ifndef __samlsp_cancel_h__
#define __samlsp_cancel_h__

#include <samlsp/base.h>

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace samlsp {

#if defined (_MSC_VER)
    #pragma warning( push )
    #pragma warning( disable : 4251 )
#endif

    /**
     * Flag shared between a blocking operation and another thread that may cancel it.
     *
     * <p>Cancellation is permanent and wakes any thread sleeping in waitFor().</p>
     */
    class SAMLSP_API CancellationToken
    {
        MAKE_NONCOPYABLE(CancellationToken);
    public:
        CancellationToken();
        ~CancellationToken();

        /**
         * Cancels the operation(s) observing this token.
         */
        void cancel();

        /**
         * Returns true iff the token has been cancelled.
         *
         * @return true iff cancelled
         */
        bool isCancelled() const;

        /**
         * Sleeps for an interval unless or until the token is cancelled.
         *
         * @param interval  time to wait
         * @return  true iff the full interval elapsed without cancellation
         */
        bool waitFor(std::chrono::milliseconds interval) const;

    private:
        bool m_cancelled;
        mutable std::mutex m_lock;
        mutable std::condition_variable m_cancel_wait;
    };

#if defined (_MSC_VER)
    #pragma warning( pop )
#endif

};

#endif /* __samlsp_cancel_h__ */
