/**
 * 客户端已发现服务器的登记表
 *
 * 只有发现监听线程、直接探测和目录刷新会写，界面只读，用读写锁保护。
 * 同一身份(address:base_port)的新记录直接覆盖旧目录，不做合并。
 */

#ifndef __LANSHARE_REGISTRY_H__
#define __LANSHARE_REGISTRY_H__

#include <map>
#include <set>
#include <string>
#include <vector>
#include <cstdint>
#include "mutex.h"
#include "catalog.pb.h"

namespace lanshare
{
    class ServerRegistry
    {
    private:
        mutable RWMutex m_rw_mutex;
        std::map<std::string,protocol::ServerRecord> m_servers;
        std::set<std::string> m_pinned; // 用户正在操作的服务器，不会因过期被删除
    public:
        static std::string identity(const std::string& address,uint32_t base_port);
        static std::string identity(const protocol::ServerRecord& record);
        static int64_t now_ms();

        // 收到广播：刷新last_seen并用新目录替换旧目录
        void upsert_announcement(const std::string& address,const protocol::Catalog& catalog,int64_t now);
        // 直接探测得到的完整记录
        void upsert(const protocol::ServerRecord& record);
        // 只替换目录，记录不存在时返回false
        bool update_catalog(const std::string& id,const protocol::Catalog& catalog,int64_t now);

        bool find(const std::string& id,protocol::ServerRecord& out) const;
        std::vector<protocol::ServerRecord> snapshot() const; // 按身份排序
        size_t size() const;

        // 删除超过window_ms没有消息的记录，返回删除数
        size_t evict_stale(int64_t now,int64_t window_ms);
        void pin(const std::string& id);
        void unpin(const std::string& id);
        bool pinned(const std::string& id) const;

        protocol::Registry to_protocol() const;
    };
}

#endif
