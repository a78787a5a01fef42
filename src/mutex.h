/**
* 封装读写锁
*
**/

#ifndef __LANSHARE_MUTEX_H__
#define __LANSHARE_MUTEX_H__

#include <pthread.h>

namespace lanshare
{
    class RWMutex
    {
    private:
        pthread_rwlock_t m_lock;
        RWMutex(const RWMutex&);
        RWMutex& operator=(const RWMutex&);
    public:
        RWMutex()
        {
            pthread_rwlock_init(&m_lock, nullptr);
        }
        ~RWMutex()
        {
            pthread_rwlock_destroy(&m_lock);
        }
        void rdlock() // 读锁
        {
            pthread_rwlock_rdlock(&m_lock);
        }
        void wrlock() // 写锁
        {
            pthread_rwlock_wrlock(&m_lock);
        }
        void unlock()
        {
            pthread_rwlock_unlock(&m_lock);
        }
    };

    // 作用域内持有读锁
    class ReadLockGuard
    {
    private:
        RWMutex& m_mutex;
    public:
        explicit ReadLockGuard(RWMutex& m):m_mutex(m){m_mutex.rdlock();};
        ~ReadLockGuard(){m_mutex.unlock();};
    };

    // 作用域内持有写锁
    class WriteLockGuard
    {
    private:
        RWMutex& m_mutex;
    public:
        explicit WriteLockGuard(RWMutex& m):m_mutex(m){m_mutex.wrlock();};
        ~WriteLockGuard(){m_mutex.unlock();};
    };

}

#endif
