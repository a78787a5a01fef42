#include <cerrno>
#include <chrono>
#include <sys/stat.h>
#include "../include/download.h"
#include "../include/config.h"
#include "../include/log.h"
#include "tar_archive.h"

namespace lanshare
{
    /**
     * Sink
     *
     * */
    FileSink::~FileSink()
    {
        if(m_fp) fclose(m_fp);
    }
    Sink::sink_ptr FileSink::Open(const std::string& path)
    {
        FILE* fp = fopen(path.c_str(),"wb");
        if(!fp)
        {
            LOG_ERROR("Could not open \"%s\" for writing: %s",path.c_str(),strerror(errno));
            return nullptr;
        }
        return sink_ptr(new FileSink(path,fp));
    }
    bool FileSink::write(const char* buffer,size_t length)
    {
        return m_fp && fwrite(buffer,1,length,m_fp)==length;
    }
    bool FileSink::finish()
    {
        if(!m_fp) return false;
        int rt = fclose(m_fp);
        m_fp = nullptr;
        if(rt!=0)
        {
            LOG_ERROR("write \"%s\" error: %s",m_path.c_str(),strerror(errno));
            return false;
        }
        return true;
    }
    void FileSink::abort()
    {
        if(m_fp)
        {
            fclose(m_fp);
            m_fp = nullptr;
        }
        if(remove(m_path.c_str())!=0)
        {
            LOG_DEBUG("remove \"%s\" error: %s",m_path.c_str(),strerror(errno));
        }
    }

    ExtractSink::~ExtractSink()
    {
        if(m_fp) fclose(m_fp);
    }
    Sink::sink_ptr ExtractSink::Open(const std::string& dest_dir,const std::string& root,const std::string& rename_to)
    {
        FILE* fp = tmpfile();
        if(!fp)
        {
            LOG_ERROR("Could not create temporary file: %s",strerror(errno));
            return nullptr;
        }
        // 先占住目录名，并发下载同名目录时不会解到一起
        std::string target = dest_dir + "/" + rename_to;
        if(mkdir(target.c_str(),0755)==-1 && errno!=EEXIST)
        {
            LOG_ERROR("mkdir \"%s\" error: %s",target.c_str(),strerror(errno));
            fclose(fp);
            return nullptr;
        }
        return sink_ptr(new ExtractSink(dest_dir,root,rename_to,fp));
    }
    bool ExtractSink::write(const char* buffer,size_t length)
    {
        return m_fp && fwrite(buffer,1,length,m_fp)==length;
    }
    bool ExtractSink::finish()
    {
        if(!m_fp || fflush(m_fp)!=0) return false;
        rewind(m_fp);
        bool ok = TarReader::extract(m_fp,m_dest_dir,nullptr,m_root,m_rename_to);
        fclose(m_fp);
        m_fp = nullptr;
        return ok;
    }
    void ExtractSink::abort()
    {
        if(m_fp)
        {
            fclose(m_fp);
            m_fp = nullptr;
        }
        // 只删除空的占位目录
        std::string target = m_dest_dir + "/" + m_rename_to;
        if(rmdir(target.c_str())!=0)
        {
            LOG_DEBUG("rmdir \"%s\" error: %s",target.c_str(),strerror(errno));
        }
    }

    /**
     * DownloadTask
     *
     * */
    DownloadTask::DownloadTask(const std::string& address,const protocol::CatalogEntry& entry,Sink* sink,int timeout_ms)
        :m_address(address),m_entry(entry),m_sink(sink),m_timeout_ms(timeout_ms),m_cancelled(false),m_bytes(0)
    {
    }

    void DownloadTask::cancel()
    {
        m_cancelled = true;
        std::lock_guard<std::mutex> lk(m_mutex);
        if(m_sock) m_sock->shutdown();
    }

    ErrorCode DownloadTask::run(ProgressCallback progress)
    {
        IPAddress::ipaddr_ptr addr = IPAddress::Create(m_address.c_str(),(uint16_t)m_entry.port());
        if(!addr) return CONNECT_FAILED;

        Socket::socket_ptr sock = Socket::create_tcp_socket();
        if(!sock->set_recv_timeout(LANSHARE_TRANSFER_IDLE_MS)) return CONNECT_FAILED;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if(m_cancelled) return CANCELLED;
            m_sock = sock;
        }

        ErrorCode rt = OK;
        if(!sock->connect(addr,m_timeout_ms))
        {
            if(m_cancelled) rt = CANCELLED;
            else
            {
                LOG_WARN("%s refused connection on port %u",m_address.c_str(),m_entry.port());
                rt = CONNECT_FAILED;
            }
        }

        auto start = std::chrono::steady_clock::now();
        auto last_update = start;
        char buffer[LANSHARE_CHUNK_SIZE];
        while(rt==OK)
        {
            int n = sock->recv(buffer,sizeof(buffer),0);
            if(n==0) break;
            if(n<0)
            {
                if(m_cancelled) rt = CANCELLED;
                else
                {
                    LOG_WARN("\"%s\" <= %s failed: %s",m_entry.name().c_str(),m_address.c_str(),strerror(errno));
                    rt = TRANSFER_FAILED;
                }
                break;
            }
            if(!m_sink->write(buffer,(size_t)n))
            {
                LOG_WARN("\"%s\" <= %s failed: local write error",m_entry.name().c_str(),m_address.c_str());
                rt = TRANSFER_FAILED;
                break;
            }
            m_bytes += n;

            auto now = std::chrono::steady_clock::now();
            if(progress && now - last_update > std::chrono::milliseconds(LANSHARE_PROGRESS_INTERVAL_MS))
            {
                double secs = std::chrono::duration<double>(now - start).count();
                progress(m_bytes,secs > 0 ? m_bytes/secs : 0);
                last_update = now;
            }
        }
        // 被取消时shutdown也会让recv返回0
        if(rt==OK && m_cancelled) rt = CANCELLED;
        if(rt==OK && progress)
        {
            double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            progress(m_bytes,secs > 0 ? m_bytes/secs : 0);
        }

        // 先在锁内摘掉m_sock再关闭，cancel()不会shutdown一个已关闭的句柄
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            m_sock.reset();
        }
        sock->close();
        return rt;
    }

    /**
     * DownloadCoordinator
     *
     * */
    DownloadCoordinator::DownloadCoordinator(const std::string& out_dir,int timeout_ms)
        :m_out_dir(out_dir),m_timeout_ms(timeout_ms)
    {
    }

    DownloadCoordinator::~DownloadCoordinator()
    {
        cancel_all();
        wait_all();
    }

    static bool path_exists(const std::string& path)
    {
        struct stat st;
        return lstat(path.c_str(),&st)==0;
    }

    std::string DownloadCoordinator::unique_name(const std::string& dir,const std::string& name)
    {
        if(!path_exists(dir + "/" + name)) return name;
        std::string base = name;
        std::string ext;
        size_t dot = name.rfind('.');
        if(dot!=std::string::npos && dot>0)
        {
            base = name.substr(0,dot);
            ext = name.substr(dot);
        }
        for(int n=1;;n++)
        {
            std::string candidate = base + "." + std::to_string(n) + ext;
            if(!path_exists(dir + "/" + candidate)) return candidate;
        }
    }

    ErrorCode DownloadCoordinator::open_sink(const protocol::CatalogEntry& entry,std::string& saved_as,Sink::sink_ptr& sink)
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        saved_as = unique_name(m_out_dir,entry.name());
        if(entry.kind()==protocol::ENTRY_DIRECTORY)
        {
            sink = ExtractSink::Open(m_out_dir,entry.name(),saved_as);
        }
        else
        {
            sink = FileSink::Open(m_out_dir + "/" + saved_as);
        }
        return sink ? OK : TRANSFER_FAILED;
    }

    ErrorCode DownloadCoordinator::execute(DownloadTask& task,Sink& sink,const std::string& saved_as,ProgressCallback progress)
    {
        ErrorCode rt = task.run(progress);
        if(rt==OK && !sink.finish())
        {
            rt = TRANSFER_FAILED;
        }
        if(rt!=OK)
        {
            sink.abort();
            if(rt==CANCELLED)
            {
                LOG_WARN("\"%s\" <= %s canceled",task.entry().name().c_str(),task.address().c_str());
            }
            return rt;
        }
        LOG_INFO("\"%s\" <= %s completed (%s)",saved_as.c_str(),task.address().c_str(),format_size(task.bytes()).c_str());
        return OK;
    }

    ErrorCode DownloadCoordinator::download(const protocol::ServerRecord& server,const protocol::CatalogEntry& entry,
        std::string& saved_as,ProgressCallback progress)
    {
        Sink::sink_ptr sink;
        ErrorCode rt = open_sink(entry,saved_as,sink);
        if(rt!=OK) return rt;
        DownloadTask task(server.address(),entry,sink.get(),m_timeout_ms);
        return execute(task,*sink,saved_as,progress);
    }

    void DownloadCoordinator::download_async(const protocol::ServerRecord& server,const protocol::CatalogEntry& entry,DoneCallback done)
    {
        std::string saved_as;
        Sink::sink_ptr owned;
        ErrorCode rt = open_sink(entry,saved_as,owned);
        if(rt!=OK)
        {
            if(done) done(rt,saved_as);
            return;
        }
        std::shared_ptr<Sink> sink(std::move(owned));
        DownloadTask::task_ptr task(new DownloadTask(server.address(),entry,sink.get(),m_timeout_ms));
        std::shared_ptr<std::atomic<bool>> finished(new std::atomic<bool>(false));

        std::lock_guard<std::mutex> lk(m_mutex);
        reap_locked();
        Active active;
        active.task = task;
        active.done = finished;
        active.thread = std::thread([task,sink,saved_as,done,finished]()
        {
            ErrorCode result = execute(*task,*sink,saved_as,nullptr);
            if(done) done(result,saved_as);
            *finished = true;
        });
        m_active.push_back(std::move(active));
    }

    void DownloadCoordinator::reap_locked()
    {
        auto it = m_active.begin();
        while(it!=m_active.end())
        {
            if(*it->done)
            {
                it->thread.join();
                it = m_active.erase(it);
            }
            else ++it;
        }
    }

    size_t DownloadCoordinator::active()
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        reap_locked();
        return m_active.size();
    }

    void DownloadCoordinator::cancel_all()
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for(auto& active:m_active)
        {
            if(!*active.done) active.task->cancel();
        }
    }

    void DownloadCoordinator::wait_all()
    {
        std::list<Active> active;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            active.swap(m_active);
        }
        for(auto& a:active)
        {
            if(a.thread.joinable()) a.thread.join();
        }
    }
}
