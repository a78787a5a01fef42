#ifndef __LANSHARE_SCHEDULER_H__
#define __LANSHARE_SCHEDULER_H__

#include <memory>
#include <vector>
#include <thread>
#include <list>
#include <mutex>
#include <functional>
#include <condition_variable>

namespace lanshare
{
    struct Task
    {
        std::function<void()> cb;
        Task(std::function<void()> c):cb(std::move(c)){};
    };

    /**
     * 线程池：所有线程都忙时临时增加线程，空闲超过idle_ms的临时线程退出，
     * 保证一个卡住的连接不会挡住其他连接
     */
    class ThreadPool : public std::enable_shared_from_this<ThreadPool>
    {
        private:
            std::list<std::thread> m_threads;
            std::vector<std::thread::id> m_exited; // 已退出、等待join的临时线程
            std::list<std::unique_ptr<Task>> m_tasks;

            size_t m_core_counts = 0; // 常驻线程数
            size_t m_threadcounts = 0; // 线程总数
            size_t m_idle_thread_counts = 0; // 空闲线程数
            int m_idle_ms;
            bool m_stop = false;

            std::mutex m_mutex;
            std::condition_variable m_cond;

            void spawn_locked();
            void reap_locked();
            void run();

        public:
            typedef std::shared_ptr<ThreadPool> thread_pool_ptr;
            ThreadPool(size_t count=1,int idle_ms=30000);
            ~ThreadPool();
            void add_task(std::function<void()> cb);
            void stop(); // 丢弃未执行的任务并等待所有线程结束
    };

}

#endif
