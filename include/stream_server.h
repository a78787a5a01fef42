/**
 * 按条目提供原始字节流的TCP服务
 *
 * base_port: 连接后直接收到目录列表，然后关闭
 * base_port+1+i: 连接后收到第i个条目的全部字节，然后关闭
 */

#ifndef __LANSHARE_STREAM_SERVER_H__
#define __LANSHARE_STREAM_SERVER_H__

#include <string>
#include <vector>
#include <set>
#include <thread>
#include <mutex>
#include <atomic>
#include <signal.h>
#include "socket.h"
#include "catalog.h"
#include "error.h"
#include "scheduler.h"

namespace lanshare
{

    class StreamServer : public std::enable_shared_from_this<StreamServer>
    {
    private:
        const ItemCatalog& m_catalog;
        std::string m_catalog_bytes; // 目录查询响应，启动时编码一次
        Socket::socket_ptr m_query_sock;
        std::vector<Socket::socket_ptr> m_socks; // 每个条目一个监听socket
        std::vector<std::thread> m_accept_threads;
        ThreadPool::thread_pool_ptr m_pool;
        std::mutex m_conn_mutex;
        std::set<Socket::socket_ptr> m_conns; // 正在服务的连接
        std::atomic<bool> is_stop;
        std::atomic<uint64_t> m_completed;

        Socket::socket_ptr listen_on(uint16_t port,ErrorCode& rt);
        void accept_loop(Socket::socket_ptr listener,int index); // index == -1 为目录查询
        void handle_client(int index,Socket::socket_ptr client);
        bool send_catalog(Socket::socket_ptr client);
        bool send_entry(const ServedItem& item,Socket::socket_ptr client);
    public:
        typedef std::shared_ptr<StreamServer> stream_server_ptr;
        explicit StreamServer(const ItemCatalog& catalog);
        ~StreamServer()
        {
            server_stop();
        }
        // 绑定并监听所有端口，任何一个失败都返回PORT_IN_USE
        ErrorCode server_listen();
        void start_server(); // 启动accept线程，需要在server_listen成功之后
        void server_stop(); // 关闭服务器
        uint64_t completed() const {return m_completed;};

        static void handle_for_sigpipe()
        {
            struct sigaction sa; //信号处理结构体
            memset(&sa, '\0', sizeof(sa));
            sa.sa_handler = SIG_IGN;//忽略SIGPIPE，写已关闭的连接时返回EPIPE
            sa.sa_flags = 0;
            if(sigaction(SIGPIPE, &sa, NULL))
            return;
        }
    };

}

#endif
