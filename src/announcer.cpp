#include <cerrno>
#include <chrono>
#include <ifaddrs.h>
#include <net/if.h>
#include "../include/announcer.h"
#include "../include/wire.h"
#include "../include/config.h"
#include "../include/log.h"

namespace lanshare
{
    Announcer::Announcer(const protocol::Catalog& catalog,uint16_t discovery_port,int interval_ms)
        :m_discovery_port(discovery_port),m_interval_ms(interval_ms),is_stop(true)
    {
        m_datagram = encode_announcement(catalog,LANSHARE_MAX_DATAGRAM);
        if(m_datagram[LANSHARE_ANNOUNCE_HEADER_LEN]!=(char)catalog.entries_size())
        {
            LOG_INFO("announcing %d of %d entries, clients fetch the rest from port %u",
                (unsigned char)m_datagram[LANSHARE_ANNOUNCE_HEADER_LEN],catalog.entries_size(),catalog.base_port());
        }
    }

    bool Announcer::add_target(const std::string& address)
    {
        IPAddress::ipaddr_ptr addr = IPAddress::Create(address.c_str(),m_discovery_port);
        if(!addr || addr->get_family()!=AF_INET)
        {
            LOG_ERROR("invalid broadcast address \"%s\"",address.c_str());
            return false;
        }
        for(auto& t:m_targets)
        {
            if(t->to_string()==addr->to_string()) return true;
        }
        m_targets.push_back(addr);
        return true;
    }

    std::vector<std::string> Announcer::interface_broadcast_addrs()
    {
        std::vector<std::string> result;
        ifaddrs* ifaddr;
        if(getifaddrs(&ifaddr)==-1)
        {
            LOG_WARN("getifaddrs error: %s",strerror(errno));
            return result;
        }
        for(ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
        {
            if(ifa->ifa_addr == nullptr || ifa->ifa_netmask == nullptr) continue;
            if(ifa->ifa_addr->sa_family != AF_INET) continue;
            if(!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_BROADCAST)) continue;

            sockaddr_in* addr = (sockaddr_in*)ifa->ifa_addr;
            sockaddr_in* netmask = (sockaddr_in*)ifa->ifa_netmask;
            // 网络地址 | ~掩码 = 定向广播地址
            in_addr broadcast;
            broadcast.s_addr = (addr->sin_addr.s_addr & netmask->sin_addr.s_addr) | ~netmask->sin_addr.s_addr;
            char buf[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET,&broadcast,buf,sizeof(buf));
            result.push_back(buf);
        }
        freeifaddrs(ifaddr);
        return result;
    }

    void Announcer::add_default_targets()
    {
        add_target(LANSHARE_BROADCAST_ADDR);
        for(const auto& addr:interface_broadcast_addrs())
        {
            add_target(addr);
        }
    }

    size_t Announcer::announce_once()
    {
        size_t sent = 0;
        if(!m_sock) return 0;
        for(auto& target:m_targets)
        {
            int rt = m_sock->sendto(m_datagram.data(),m_datagram.size(),target);
            if(rt==-1)
            {
                LOG_DEBUG("announce to %s:%u error: %s",target->to_string().c_str(),m_discovery_port,strerror(errno));
                continue;
            }
            sent++;
        }
        return sent;
    }

    bool Announcer::start()
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if(!is_stop)
        {
            LOG_WARN("the announcer is running.");
            return true;
        }
        if(m_targets.empty()) add_default_targets();
        m_sock = Socket::create_udp_socket();
        if(!m_sock || !m_sock->set_broadcast(true))
        {
            LOG_ERROR("cannot create broadcast socket");
            return false;
        }
        is_stop = false;
        m_thread = std::thread(&Announcer::run,this);
        LOG_INFO("Announcing on UDP port %u every %d ms",m_discovery_port,m_interval_ms);
        return true;
    }

    void Announcer::stop()
    {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if(is_stop) return;
            is_stop = true;
        }
        m_cond.notify_all();
        if(m_thread.joinable()) m_thread.join();
        m_sock->close();
    }

    void Announcer::run()
    {
        std::unique_lock<std::mutex> lk(m_mutex);
        while(!is_stop)
        {
            lk.unlock();
            announce_once();
            lk.lock();
            m_cond.wait_for(lk,std::chrono::milliseconds(m_interval_ms),[this]{return is_stop;});
        }
    }
}
