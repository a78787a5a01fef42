/**
 * 定时广播服务器身份、base_port和目录摘要
 * 不等待任何回应，重复发送本身就是存活信号
 */

#ifndef __LANSHARE_ANNOUNCER_H__
#define __LANSHARE_ANNOUNCER_H__

#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include "socket.h"
#include "catalog.pb.h"

namespace lanshare
{
    class Announcer
    {
    private:
        std::string m_datagram;
        uint16_t m_discovery_port;
        int m_interval_ms;
        std::vector<IPAddress::ipaddr_ptr> m_targets;
        Socket::socket_ptr m_sock;
        std::thread m_thread;
        std::mutex m_mutex;
        std::condition_variable m_cond;
        bool is_stop;

        void run();
    public:
        Announcer(const protocol::Catalog& catalog,uint16_t discovery_port,int interval_ms);
        ~Announcer()
        {
            stop();
        }
        bool add_target(const std::string& address); // 数字形式的ipv4地址
        // 255.255.255.255 加上各网卡的定向广播地址
        void add_default_targets();
        size_t target_count() const {return m_targets.size();};

        bool start();
        void stop();
        size_t announce_once(); // 返回发送成功的目标数

        static std::vector<std::string> interface_broadcast_addrs();
    };
}

#endif
