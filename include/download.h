/**
 * 下载：连接条目端口，把收到的字节写入本地，直到对方关闭连接
 * 没有长度和校验，对方关闭即视为完成；失败后只能从头重新下载
 */

#ifndef __LANSHARE_DOWNLOAD_H__
#define __LANSHARE_DOWNLOAD_H__

#include <string>
#include <vector>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>
#include <cstdio>
#include "socket.h"
#include "error.h"
#include "catalog.pb.h"

namespace lanshare
{
    class Sink
    {
    public:
        typedef std::unique_ptr<Sink> sink_ptr;
        virtual ~Sink(){};
        virtual bool write(const char* buffer,size_t length) = 0;
        virtual bool finish() = 0; // 传输完成后调用
        virtual void abort() = 0;  // 传输失败后调用，清理半成品
    };

    class FileSink : public Sink
    {
    private:
        std::string m_path;
        FILE* m_fp;
    public:
        FileSink(const std::string& path,FILE* fp):m_path(path),m_fp(fp){};
        ~FileSink();
        static sink_ptr Open(const std::string& path);
        bool write(const char* buffer,size_t length);
        bool finish();
        void abort();
    };

    // 目录条目：先收到临时文件，完成后解包到dest_dir
    class ExtractSink : public Sink
    {
    private:
        std::string m_dest_dir;
        std::string m_root;
        std::string m_rename_to;
        FILE* m_fp;
    public:
        ExtractSink(const std::string& dest_dir,const std::string& root,const std::string& rename_to,FILE* fp)
            :m_dest_dir(dest_dir),m_root(root),m_rename_to(rename_to),m_fp(fp){};
        ~ExtractSink();
        static sink_ptr Open(const std::string& dest_dir,const std::string& root,const std::string& rename_to);
        bool write(const char* buffer,size_t length);
        bool finish();
        void abort();
    };

    // 参数：已收到的字节数，平均速度(字节/秒)
    typedef std::function<void(uint64_t,double)> ProgressCallback;

    class DownloadTask : public std::enable_shared_from_this<DownloadTask>
    {
    private:
        std::string m_address;
        protocol::CatalogEntry m_entry;
        Sink* m_sink;
        int m_timeout_ms;
        std::mutex m_mutex;
        Socket::socket_ptr m_sock;
        std::atomic<bool> m_cancelled;
        std::atomic<uint64_t> m_bytes;
    public:
        typedef std::shared_ptr<DownloadTask> task_ptr;
        DownloadTask(const std::string& address,const protocol::CatalogEntry& entry,Sink* sink,int timeout_ms);
        // 阻塞直到完成、失败或被取消；不会调用sink的finish/abort
        ErrorCode run(ProgressCallback progress=nullptr);
        // 可以在其他线程调用，立即关闭连接
        void cancel();
        uint64_t bytes() const {return m_bytes;};
        const protocol::CatalogEntry& entry() const {return m_entry;};
        const std::string& address() const {return m_address;};
    };

    class DownloadCoordinator
    {
    private:
        struct Active
        {
            DownloadTask::task_ptr task;
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };
        std::string m_out_dir;
        int m_timeout_ms;
        std::mutex m_mutex;
        std::list<Active> m_active;

        void reap_locked();
        ErrorCode open_sink(const protocol::CatalogEntry& entry,std::string& saved_as,Sink::sink_ptr& sink);
        static ErrorCode execute(DownloadTask& task,Sink& sink,const std::string& saved_as,ProgressCallback progress);
    public:
        typedef std::function<void(ErrorCode,const std::string&)> DoneCallback;
        DownloadCoordinator(const std::string& out_dir,int timeout_ms);
        ~DownloadCoordinator();

        // dir下name已存在时返回 base.N.ext 中第一个不存在的
        static std::string unique_name(const std::string& dir,const std::string& name);

        // 同步下载，saved_as为本地的名字(相对out_dir)
        ErrorCode download(const protocol::ServerRecord& server,const protocol::CatalogEntry& entry,
            std::string& saved_as,ProgressCallback progress=nullptr);
        // 在后台线程下载，结束时调用done
        void download_async(const protocol::ServerRecord& server,const protocol::CatalogEntry& entry,DoneCallback done=nullptr);
        size_t active();
        void cancel_all();
        void wait_all();
    };
}

#endif
