#include <cerrno>
#include <vector>
#include "../include/discovery_listener.h"
#include "../include/wire.h"
#include "../include/log.h"

#define DISCOVERY_POLL_MS 200
#define DISCOVERY_BUFFER_SIZE 65536

namespace lanshare
{
    DiscoveryListener::DiscoveryListener(ServerRegistry& registry,uint16_t port,int stale_window_ms)
        :m_registry(registry),m_port(port),m_stale_window_ms(stale_window_ms),
        is_stop(true),m_accepted(0),m_dropped(0)
    {
    }

    bool DiscoveryListener::start()
    {
        if(!is_stop)
        {
            LOG_WARN("the discovery listener is running.");
            return true;
        }
        m_sock = Socket::create_udp_socket();
        if(!m_sock) return false;
        // 同一台机器上可以同时运行多个客户端
        if(!m_sock->set_reuse_port(true) || !m_sock->set_broadcast(true)) return false;
        if(!m_sock->set_recv_timeout(DISCOVERY_POLL_MS)) return false;
        IPAddress::ipaddr_ptr addr(new IPAddress(4,INADDR_ANY,m_port));
        if(!m_sock->bind(addr))
        {
            LOG_ERROR("cannot listen for announcements on UDP port %u: %s",m_port,strerror(errno));
            m_sock->close();
            return false;
        }
        m_port = m_sock->getLocalPort();
        is_stop = false;
        m_thread = std::thread(&DiscoveryListener::run,this);
        LOG_DEBUG("Listening for announcements on UDP port %u",m_port);
        return true;
    }

    void DiscoveryListener::stop()
    {
        if(is_stop) return;
        is_stop = true;
        if(m_thread.joinable()) m_thread.join();
        m_sock->close();
    }

    ErrorCode DiscoveryListener::handle_datagram(const char* data,size_t length,const std::string& sender,int64_t now)
    {
        protocol::Catalog catalog;
        ErrorCode rt = decode_announcement(data,length,catalog);
        if(rt!=OK)
        {
            m_dropped++;
            LOG_DEBUG("Ignoring bogus announcement from %s (%zu bytes)",sender.c_str(),length);
            return rt;
        }
        m_accepted++;
        m_registry.upsert_announcement(sender,catalog,now);
        return OK;
    }

    void DiscoveryListener::run()
    {
        std::vector<char> buffer(DISCOVERY_BUFFER_SIZE);
        while(!is_stop)
        {
            sockaddr_in from;
            int n = m_sock->recvfrom(buffer.data(),buffer.size(),from,MSG_TRUNC);
            if(n<0)
            {
                if(errno!=EAGAIN && errno!=EWOULDBLOCK && errno!=EINTR)
                {
                    LOG_WARN("recvfrom error: %s",strerror(errno));
                }
            }
            else
            {
                IPAddress sender(from);
                if((size_t)n > buffer.size())
                {
                    // 被截断的报文按格式错误处理
                    m_dropped++;
                    LOG_DEBUG("Ignoring oversized announcement from %s",sender.to_string().c_str());
                }
                else
                {
                    handle_datagram(buffer.data(),(size_t)n,sender.to_string(),ServerRegistry::now_ms());
                }
            }
            if(m_stale_window_ms > 0)
            {
                m_registry.evict_stale(ServerRegistry::now_ms(),m_stale_window_ms);
            }
        }
    }
}
