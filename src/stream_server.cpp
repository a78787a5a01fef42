#include <cerrno>
#include <chrono>
#include "../include/stream_server.h"
#include "../include/wire.h"
#include "../include/config.h"
#include "../include/log.h"

namespace lanshare
{
    StreamServer::StreamServer(const ItemCatalog& catalog)
        :m_catalog(catalog),is_stop(true),m_completed(0)
    {
        handle_for_sigpipe();
        m_catalog_bytes = encode_catalog_response(m_catalog.to_protocol());
    }

    Socket::socket_ptr StreamServer::listen_on(uint16_t port,ErrorCode& rt)
    {
        Socket::socket_ptr sock = Socket::create_tcp_socket();
        IPAddress::ipaddr_ptr addr(new IPAddress(4,INADDR_ANY,port));
        if(!sock->bind(addr))
        {
            LOG_ERROR("cannot bind port %u: %s",port,strerror(errno));
            rt = PORT_IN_USE;
            return nullptr;
        }
        if(!sock->listen())
        {
            rt = PORT_IN_USE;
            return nullptr;
        }
        rt = OK;
        return sock;
    }

    ErrorCode StreamServer::server_listen()
    {
        ErrorCode rt = ItemCatalog::check_bounds(m_catalog.base_port(),m_catalog.size());
        if(rt!=OK) return rt;

        m_query_sock = listen_on(m_catalog.base_port(),rt);
        if(!m_query_sock) return rt;
        for(size_t i=0;i<m_catalog.size();i++)
        {
            Socket::socket_ptr sock = listen_on((uint16_t)m_catalog.item(i).entry.port(),rt);
            if(!sock)
            {
                // 部分目录会让客户端困惑，全部关闭
                for(auto& s:m_socks) s->close();
                m_socks.clear();
                m_query_sock->close();
                m_query_sock.reset();
                return rt;
            }
            m_socks.push_back(sock);
        }
        return OK;
    }

    void StreamServer::start_server()
    {
        if(!is_stop)
        {
            LOG_WARN("the server is running.");
            return;
        }
        if(!m_query_sock)
        {
            LOG_ERROR("start_server called before server_listen");
            return;
        }
        is_stop = false;
        m_pool.reset(new ThreadPool(LANSHARE_POOL_THREADS,LANSHARE_POOL_IDLE_MS));

        m_accept_threads.push_back(std::thread(&StreamServer::accept_loop,this,m_query_sock,-1));
        for(size_t i=0;i<m_socks.size();i++)
        {
            m_accept_threads.push_back(std::thread(&StreamServer::accept_loop,this,m_socks[i],(int)i));
        }
        LOG_DEBUG("server started with %zu listeners",m_socks.size()+1);
    }

    void StreamServer::server_stop()
    {
        if(is_stop)
        {
            // 只调用过server_listen
            if(m_query_sock) m_query_sock->close();
            for(auto& sock:m_socks) sock->close();
            return;
        }
        is_stop = true;
        // shutdown唤醒阻塞在accept上的线程
        if(m_query_sock) m_query_sock->shutdown();
        for(auto& sock:m_socks) sock->shutdown();
        for(auto& t:m_accept_threads)
        {
            if(t.joinable()) t.join();
        }
        m_accept_threads.clear();
        {
            std::lock_guard<std::mutex> lk(m_conn_mutex);
            for(auto& conn:m_conns) conn->shutdown();
        }
        if(m_pool) m_pool->stop();
        if(m_query_sock) m_query_sock->close();
        for(auto& sock:m_socks) sock->close();
    }

    void StreamServer::accept_loop(Socket::socket_ptr listener,int index)
    {
        while(!is_stop)
        {
            Socket::socket_ptr client = listener->accept();
            if(!client)
            {
                if(is_stop) break;
                int err = errno;
                if(err==EINTR || err==ECONNABORTED) continue;
                LOG_WARN("accept error: %s",strerror(err));
                if(err==EMFILE || err==ENFILE || err==ENOBUFS || err==ENOMEM)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                continue;
            }
            m_pool->add_task(std::bind(&StreamServer::handle_client,this,index,client));
        }
    }

    void StreamServer::handle_client(int index,Socket::socket_ptr client)
    {
        {
            std::lock_guard<std::mutex> lk(m_conn_mutex);
            if(is_stop) return;
            m_conns.insert(client);
        }
        bool ok;
        if(index<0)
        {
            ok = send_catalog(client);
        }
        else
        {
            ok = send_entry(m_catalog.item(index),client);
        }
        if(ok) m_completed++;
        {
            std::lock_guard<std::mutex> lk(m_conn_mutex);
            m_conns.erase(client);
        }
        client->close();
    }

    bool StreamServer::send_catalog(Socket::socket_ptr client)
    {
        std::string peer = client->m_remoteAddress->to_string();
        LOG_DEBUG("Sending file list to %s",peer.c_str());
        if(!client->send_all(m_catalog_bytes.data(),m_catalog_bytes.size()))
        {
            LOG_WARN("%s closed connection: %s",peer.c_str(),strerror(errno));
            return false;
        }
        return true;
    }

    bool StreamServer::send_entry(const ServedItem& item,Socket::socket_ptr client)
    {
        std::string peer = client->m_remoteAddress->to_string();
        const char* name = item.entry.name().c_str();
        LOG_INFO("%s wants \"%s\"",peer.c_str(),name);

        ByteSource::source_ptr source = item.open();
        if(!source)
        {
            return false;
        }
        char buffer[LANSHARE_CHUNK_SIZE];
        uint64_t numb = 0;
        while(true)
        {
            ssize_t size = source->read(buffer,sizeof(buffer));
            if(size<0)
            {
                LOG_WARN("read error on \"%s\", aborting transfer to %s",name,peer.c_str());
                return false;
            }
            if(size==0) break;
            if(!client->send_all(buffer,(size_t)size))
            {
                if(errno==EPIPE || errno==ECONNRESET)
                {
                    LOG_WARN("%s closed connection",peer.c_str());
                }
                else
                {
                    LOG_WARN("send to %s error: %s",peer.c_str(),strerror(errno));
                }
                return false;
            }
            numb += size;
        }
        LOG_INFO("\"%s\" => %s completed (%s)",name,peer.c_str(),format_size(numb).c_str());
        return true;
    }
}
