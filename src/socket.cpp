#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/time.h>
#include "../include/socket.h"
#include "../include/log.h"

namespace lanshare
{
    /**
     * IPAddress类相关API定义
     *
     * */
    IPAddress::IPAddress(int flag)
    {
        m_flag=flag;
        memset(&m_addr,0,sizeof(sockaddr_in));
        memset(&m_addr6,0,sizeof(sockaddr_in6));
        if(m_flag == 4)
        {
            m_addr.sin_family = AF_INET;
        }
        else if(m_flag == 6)
        {
            m_addr6.sin6_family = AF_INET6;
        }
    }
    IPAddress::IPAddress(int flag,uint32_t address,uint16_t port)
    {
        m_flag = 4;
        memset(&m_addr,0,sizeof(sockaddr_in));
        memset(&m_addr6,0,sizeof(sockaddr_in6));
        // 整数形式只支持ipv4
        if(flag != 4)
        {
            LOG_WARN("IPAddress(%d,...) only supports ipv4, using ipv4",flag);
        }
        m_addr.sin_family = AF_INET;
        m_addr.sin_addr.s_addr = htonl(address);
        m_addr.sin_port = htons(port);
    }
    IPAddress::IPAddress(const sockaddr_in& addr)
    {
        m_flag = 4;
        memset(&m_addr6,0,sizeof(sockaddr_in6));
        m_addr = addr;
    }
    IPAddress::ipaddr_ptr IPAddress::Create(const char* address, uint16_t port)
    {
        addrinfo hints,*results;
        memset(&hints,0,sizeof(addrinfo));
        hints.ai_flags = AI_NUMERICHOST;
        hints.ai_family = AF_UNSPEC;
        int rt = getaddrinfo(address,NULL,&hints,&results);
        if(rt!=0)
        {
            LOG_ERROR("ip address create error: %s: %s",address,gai_strerror(rt));
            return nullptr;
        }
        sockaddr *addr = results->ai_addr;
        if(addr==nullptr)
        {
            freeaddrinfo(results);
            return nullptr;
        }
        IPAddress::ipaddr_ptr result(new IPAddress());
        if(addr->sa_family==AF_INET)
        {
            result->m_flag = 4;
            result->m_addr=*(sockaddr_in*)addr;
            result->m_addr.sin_port = htons(port);
        }
        else if(addr->sa_family==AF_INET6)
        {
            result->m_flag = 6;
            result->m_addr6=*(sockaddr_in6*)addr;
            result->m_addr6.sin6_port = htons(port);
        }
        freeaddrinfo(results);
        return result;
    }
    IPAddress::ipaddr_ptr IPAddress::Resolve(const char* host, uint16_t port)
    {
        addrinfo hints,*results;
        memset(&hints,0,sizeof(addrinfo));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        int rt = getaddrinfo(host,NULL,&hints,&results);
        if(rt!=0)
        {
            LOG_WARN("cannot resolve %s: %s",host,gai_strerror(rt));
            return nullptr;
        }
        IPAddress::ipaddr_ptr result;
        if(results->ai_addr!=nullptr && results->ai_addr->sa_family==AF_INET)
        {
            result.reset(new IPAddress(*(sockaddr_in*)results->ai_addr));
            result->set_port(port);
        }
        freeaddrinfo(results);
        return result;
    }
    int IPAddress::get_family()
    {
        if(m_flag==4)
        {
            return m_addr.sin_family;
        }
        else
        {
            return m_addr6.sin6_family;
        }
    }
    sockaddr* IPAddress::get_addr()
    {
        if(m_flag==4)
        {
            return (sockaddr*)&m_addr;
        }
        else
        {
            return (sockaddr*)&m_addr6;
        }
    }
    socklen_t IPAddress::get_addr_len()
    {
        if(m_flag==4)
        {
            return sizeof(m_addr);
        }
        else
        {
            return sizeof(m_addr6);
        }
    }
    uint16_t IPAddress::get_port()
    {
        if(m_flag==4) return ntohs(m_addr.sin_port);
        return ntohs(m_addr6.sin6_port);
    }
    void IPAddress::set_port(uint16_t port)
    {
        if(m_flag==4) m_addr.sin_port = htons(port);
        else m_addr6.sin6_port = htons(port);
    }
    std::string IPAddress::to_string()
    {
        char buf[INET6_ADDRSTRLEN] = {0};
        if(m_flag==4)
        {
            inet_ntop(AF_INET,&m_addr.sin_addr,buf,sizeof(buf));
        }
        else
        {
            inet_ntop(AF_INET6,&m_addr6.sin6_addr,buf,sizeof(buf));
        }
        return buf;
    }

    /**
     * Socket类相关API定义
     *
     * */
    Socket::Socket(int family,int type,int protocol)
    {
        m_socket = -1;
        m_family = family;
        m_type = type;
        m_protocol = protocol;
        is_connected = false;
    }
    Socket::~Socket()
    {
        close();
    }
    bool Socket::ensure_created()
    {
        if(m_socket != -1) return true;
        m_socket = ::socket(m_family,m_type,m_protocol);
        if(m_socket==-1)
        {
            LOG_ERROR("socket error: %s",strerror(errno));
            return false;
        }
        init_socket();
        return true;
    }
    void Socket::init_socket()
    {
        int val=1;
        setOption(SOL_SOCKET,SO_REUSEADDR,&val,(socklen_t)sizeof(val));
        if(m_type == SOCK_STREAM)
        {
            setOption(SOL_SOCKET,SO_KEEPALIVE,&val,(socklen_t)sizeof(val));
            setOption(IPPROTO_TCP,TCP_NODELAY,&val,(socklen_t)sizeof(val));
        }
    }
    Socket::socket_ptr Socket::create_tcp_socket()
    {
        socket_ptr sock(new Socket(Ipv4,TCP,0));
        return sock;
    }
    Socket::socket_ptr Socket::create_udp_socket()
    {
        socket_ptr sock(new Socket(Ipv4,UDP,IPPROTO_UDP));
        // 发送广播前不需要bind，这里直接创建句柄
        if(!sock->ensure_created()) return nullptr;
        return sock;
    }
    bool Socket::setOption(int level,int option,const void *result,socklen_t len)
    {
        int rt = setsockopt(m_socket,level,option,result,(socklen_t)len);
        if(rt==-1)
        {
            LOG_ERROR("setsockopt(%d,%d) error: %s",level,option,strerror(errno));
            return false;
        }
        return true;
    }
    bool Socket::set_broadcast(bool on)
    {
        if(!ensure_created()) return false;
        int val = on ? 1 : 0;
        return setOption(SOL_SOCKET,SO_BROADCAST,&val,(socklen_t)sizeof(val));
    }
    bool Socket::set_reuse_port(bool on)
    {
        if(!ensure_created()) return false;
        int val = on ? 1 : 0;
        return setOption(SOL_SOCKET,SO_REUSEPORT,&val,(socklen_t)sizeof(val));
    }
    bool Socket::set_recv_timeout(int timeout_ms)
    {
        if(!ensure_created()) return false;
        timeval tv;
        tv.tv_sec = timeout_ms/1000;
        tv.tv_usec = (timeout_ms%1000)*1000;
        return setOption(SOL_SOCKET,SO_RCVTIMEO,&tv,(socklen_t)sizeof(tv));
    }
    uint16_t Socket::getLocalPort()
    {
        sockaddr_in addr;
        socklen_t addrsize = sizeof(addr);
        memset(&addr,0,sizeof(addr));
        int rt = ::getsockname(m_socket,(sockaddr *)&addr,&addrsize);
        if(rt==-1)
        {
            LOG_ERROR("getsockname(%d) error: %s",m_socket,strerror(errno));
            return 0;
        }
        return ntohs(addr.sin_port);
    }

    bool Socket::bind(const IPAddress::ipaddr_ptr address)
    {
        if(!ensure_created()) return false;

        if(address->get_family()!=m_family)
        {
            LOG_ERROR("address family(%d) and socket family(%d) is not equal.",address->get_family(),m_family);
            return false;
        }

        int rt = ::bind(m_socket,address->get_addr(),address->get_addr_len());
        if(rt==-1)
        {
            // 调用者根据errno区分EADDRINUSE
            int saved = errno;
            LOG_DEBUG("bind port %u error: %s",address->get_port(),strerror(saved));
            errno = saved;
            return false;
        }
        m_localAddress = address;
        return true;
    }

    bool Socket::listen(int backlog)
    {
        if(m_socket==-1)
        {
            LOG_ERROR("listen error: socket fd = -1.");
            return false;
        }
        int rt = ::listen(m_socket,backlog);
        if(rt==-1)
        {
            LOG_ERROR("listen error: %s",strerror(errno));
            return false;
        }
        return true;
    }
    Socket::socket_ptr Socket::accept()
    {
        sockaddr_in client_addr;
        socklen_t size = sizeof(client_addr);

        int connected_fd = ::accept(m_socket,(sockaddr*)&client_addr,&size);

        if(connected_fd==-1)
        {
            return nullptr;
        }

        socket_ptr new_socket(new Socket(m_family,m_type,m_protocol));
        new_socket->m_socket = connected_fd;
        new_socket->is_connected = true;
        new_socket->init_socket();
        new_socket->m_localAddress = m_localAddress;
        new_socket->m_remoteAddress.reset(new IPAddress(client_addr));

        return new_socket;
    }
    bool Socket::connect(const IPAddress::ipaddr_ptr address,int timeout_ms)
    {
        m_remoteAddress = address;
        if(!ensure_created()) return false;
        if(address->get_family()!=m_family)
        {
            LOG_ERROR("address family(%d) and socket family(%d) is not equal.",address->get_family(),m_family);
            return false;
        }

        // 非阻塞connect，poll等待可写
        int flags = fcntl(m_socket,F_GETFL,0);
        if(flags==-1 || fcntl(m_socket,F_SETFL,flags|O_NONBLOCK)==-1)
        {
            LOG_ERROR("fcntl error: %s",strerror(errno));
            return false;
        }
        int rt=::connect(m_socket,address->get_addr(),address->get_addr_len());
        int err = 0;
        if(rt==-1)
        {
            if(errno!=EINPROGRESS)
            {
                err = errno;
            }
            else
            {
                pollfd pfd;
                pfd.fd = m_socket;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                do
                {
                    rt = ::poll(&pfd,1,timeout_ms);
                }
                while(rt==-1 && errno==EINTR);
                if(rt==0)
                {
                    err = ETIMEDOUT;
                }
                else if(rt==-1)
                {
                    err = errno;
                }
                else
                {
                    socklen_t len = sizeof(err);
                    if(getsockopt(m_socket,SOL_SOCKET,SO_ERROR,&err,&len)==-1) err = errno;
                }
            }
        }
        if(err!=0)
        {
            LOG_DEBUG("connect %s:%u error: %s",address->to_string().c_str(),address->get_port(),strerror(err));
            errno = err;
            return false;
        }
        if(fcntl(m_socket,F_SETFL,flags)==-1)
        {
            int saved = errno;
            LOG_ERROR("fcntl error: %s",strerror(saved));
            errno = saved;
            return false;
        }
        is_connected = true;
        return true;
    }
    int Socket::recv(void* buffer,size_t length,int flags)
    {
        if(is_connected)
        {
            int rt;
            do
            {
                rt = ::recv(m_socket,buffer,length,flags);
            }
            while(rt==-1 && errno==EINTR);
            return rt;
        }
        LOG_ERROR("socket is not connected");
        errno = ENOTCONN;
        return -1;
    }
    int Socket::send(const void* buffer,size_t length,int flags)
    {
        if(is_connected)
        {
            return ::send(m_socket,buffer,length,flags|MSG_NOSIGNAL);
        }
        LOG_ERROR("socket is not connected");
        errno = ENOTCONN;
        return -1;
    }
    bool Socket::send_all(const void* buffer,size_t length)
    {
        const char* p = static_cast<const char*>(buffer);
        while(length>0)
        {
            int rt = send(p,length,0);
            if(rt==-1)
            {
                if(errno==EINTR) continue;
                return false;
            }
            p += rt;
            length -= rt;
        }
        return true;
    }
    int Socket::sendto(const void* buffer,size_t length,IPAddress::ipaddr_ptr to)
    {
        if(!ensure_created()) return -1;
        return ::sendto(m_socket,buffer,length,MSG_NOSIGNAL,to->get_addr(),to->get_addr_len());
    }
    int Socket::recvfrom(void* buffer,size_t length,sockaddr_in& from,int flags)
    {
        if(m_socket==-1)
        {
            errno = EBADF;
            return -1;
        }
        socklen_t len = sizeof(from);
        memset(&from,0,sizeof(from));
        return ::recvfrom(m_socket,buffer,length,flags,(sockaddr*)&from,&len);
    }
    bool Socket::shutdown(int how)
    {
        if(m_socket==-1) return false;
        // 对端可能已经关闭，ENOTCONN不算错误
        if(::shutdown(m_socket,how)==-1 && errno!=ENOTCONN)
        {
            LOG_DEBUG("shutdown fd(%d) error: %s",m_socket,strerror(errno));
            return false;
        }
        return true;
    }
    bool Socket::close()
    {
        is_connected = false;
        if(m_socket!=-1)
        {
            int rt = ::close(m_socket);
            m_socket=-1;
            if(rt==-1)
            {
                LOG_DEBUG("close fd error: %s",strerror(errno));
                return false;
            }
        }
        return true;
    }

}
