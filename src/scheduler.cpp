#include <algorithm>
#include <chrono>
#include "scheduler.h"
#include "../include/log.h"

namespace lanshare
{
    ThreadPool::ThreadPool(size_t count,int idle_ms)
    {
        m_core_counts = count==0 ? 1 : count;
        m_idle_ms = idle_ms;
        std::lock_guard<std::mutex> lk(m_mutex);
        for(size_t i=0;i<m_core_counts;i++)
        {
            spawn_locked();
        }
    }
    ThreadPool::~ThreadPool()
    {
        stop();
    }
    void ThreadPool::spawn_locked()
    {
        m_threads.push_back(std::thread(&ThreadPool::run,this));
        m_threadcounts++;
    }
    void ThreadPool::reap_locked()
    {
        if(m_exited.empty()) return;
        auto it = m_threads.begin();
        while(it!=m_threads.end())
        {
            if(std::find(m_exited.begin(),m_exited.end(),it->get_id())!=m_exited.end())
            {
                it->join();
                it = m_threads.erase(it);
            }
            else ++it;
        }
        m_exited.clear();
    }
    void ThreadPool::add_task(std::function<void()> cb)
    {
        std::unique_lock<std::mutex> lk(m_mutex);
        if(m_stop)
        {
            LOG_WARN("thread pool stopped, task dropped");
            return;
        }
        reap_locked();
        m_tasks.push_back(std::unique_ptr<Task>(new Task(std::move(cb))));
        // 空闲线程不够分配时新增线程
        if(m_idle_thread_counts < m_tasks.size())
        {
            spawn_locked();
            LOG_DEBUG("thread pool grows to %zu threads",m_threadcounts);
        }
        lk.unlock();
        m_cond.notify_one();
    }
    void ThreadPool::stop()
    {
        std::list<std::thread> threads;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if(m_stop && m_threads.empty()) return;
            m_stop = true;
            m_tasks.clear();
            threads.swap(m_threads);
        }
        m_cond.notify_all();
        for(auto& t:threads)
        {
            if(t.joinable()) t.join();
        }
        std::lock_guard<std::mutex> lk(m_mutex);
        m_exited.clear();
    }
    void ThreadPool::run()
    {
        while(true)
        {
            std::unique_ptr<Task> task;
            {
                std::unique_lock<std::mutex> lk(m_mutex);
                m_idle_thread_counts++;
                while(m_tasks.empty() && !m_stop)
                {
                    auto rt = m_cond.wait_for(lk,std::chrono::milliseconds(m_idle_ms));
                    if(rt==std::cv_status::timeout && m_tasks.empty() && m_threadcounts > m_core_counts)
                    {
                        // 临时线程空闲太久，退出
                        m_idle_thread_counts--;
                        m_threadcounts--;
                        m_exited.push_back(std::this_thread::get_id());
                        return;
                    }
                }
                m_idle_thread_counts--;
                if(m_stop)
                {
                    m_threadcounts--;
                    return;
                }
                task = std::move(m_tasks.front());
                m_tasks.pop_front();
            }
            try
            {
                task->cb();
            }
            catch(const std::exception& e)
            {
                LOG_ERROR("exception in threadpool task: %s",e.what());
            }
            catch(...)
            {
                LOG_ERROR("unknown exception in threadpool task");
            }
        }
    }
}
