#ifndef __LANSHARE_DISCOVERY_LISTENER_H__
#define __LANSHARE_DISCOVERY_LISTENER_H__

#include <string>
#include <thread>
#include <atomic>
#include "socket.h"
#include "error.h"
#include "registry.h"

namespace lanshare
{
    /**
     * 接收服务器广播并写入登记表
     * 格式不对或版本不符的报文直接丢弃，不影响已有记录
     */
    class DiscoveryListener
    {
    private:
        ServerRegistry& m_registry;
        uint16_t m_port;
        int m_stale_window_ms;
        Socket::socket_ptr m_sock;
        std::thread m_thread;
        std::atomic<bool> is_stop;
        std::atomic<uint64_t> m_accepted;
        std::atomic<uint64_t> m_dropped;

        void run();
    public:
        DiscoveryListener(ServerRegistry& registry,uint16_t port,int stale_window_ms);
        ~DiscoveryListener()
        {
            stop();
        }
        bool start(); // port为0时绑定任意端口，用port()取得实际端口
        void stop();
        uint16_t port() const {return m_port;};

        ErrorCode handle_datagram(const char* data,size_t length,const std::string& sender,int64_t now);
        uint64_t accepted() const {return m_accepted;};
        uint64_t dropped() const {return m_dropped;};
    };
}

#endif
