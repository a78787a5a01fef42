/**
* 封装底层socket接口
* TCP/UDP，附带广播、超时、限时connect
**/

#ifndef __LANSHARE_SOCKET_H__
#define __LANSHARE_SOCKET_H__

#include <sys/socket.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <memory>
#include <string>
#include <cstring>
#include <sys/types.h>
#include <netinet/tcp.h>
#include <unistd.h>

namespace lanshare
{
    class IPAddress : public std::enable_shared_from_this<IPAddress>
    {
        private:
            sockaddr_in m_addr;
            sockaddr_in6 m_addr6;
            int m_flag; // ==4:ipv4,==6:ipv6 标识是什么类型的IP地址
        public:
            typedef std::shared_ptr<IPAddress> ipaddr_ptr;
            IPAddress(int flag=4);
            IPAddress(int flag, uint32_t address,uint16_t port=0);
            explicit IPAddress(const sockaddr_in& addr);
            static ipaddr_ptr Create(const char* address, uint16_t port=0); // 只接受数字形式的地址
            static ipaddr_ptr Resolve(const char* host, uint16_t port=0); // 数字地址或主机名，只取ipv4
            int get_family();
            sockaddr* get_addr();
            socklen_t get_addr_len();
            uint16_t get_port();
            void set_port(uint16_t port);
            std::string to_string(); // 只有地址部分，不带端口
    };

    class Socket : public std::enable_shared_from_this<Socket>
    {
        protected:
            int m_socket; // 句柄
            int m_family;
            int m_type;
            int m_protocol;
            bool is_connected;

            bool ensure_created();

        public:
            IPAddress::ipaddr_ptr m_localAddress;
            IPAddress::ipaddr_ptr m_remoteAddress;
            typedef std::shared_ptr<Socket> socket_ptr;

            enum Family
            {
                Ipv4 = AF_INET,
                Ipv6 = AF_INET6,
                Unix = AF_UNIX
            };
            enum Type
            {
                TCP = SOCK_STREAM,
                UDP = SOCK_DGRAM
            };

            Socket(int family,int type,int protocol=0);
            ~Socket();
            void init_socket();

            static Socket::socket_ptr create_tcp_socket();
            static Socket::socket_ptr create_udp_socket();
            bool setOption(int level,int option,const void *result,socklen_t len);
            bool set_broadcast(bool on);
            bool set_reuse_port(bool on);
            bool set_recv_timeout(int timeout_ms);
            uint16_t getLocalPort(); // getsockname
            bool bind(const IPAddress::ipaddr_ptr address);
            bool listen(int backlog = SOMAXCONN);
            Socket::socket_ptr accept();
            // 超时返回false，errno为ETIMEDOUT
            // 失败时句柄不关闭，由调用者close
            bool connect(const IPAddress::ipaddr_ptr address,int timeout_ms);
            int send(const void* buffer,size_t length,int flags);
            bool send_all(const void* buffer,size_t length);
            int recv(void* buffer,size_t length,int flags);
            int sendto(const void* buffer,size_t length,IPAddress::ipaddr_ptr to);
            int recvfrom(void* buffer,size_t length,sockaddr_in& from,int flags=0);
            bool shutdown(int how = SHUT_RDWR);
            bool close(); // 关闭socket

    };
}



#endif
