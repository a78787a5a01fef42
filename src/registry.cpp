#include <chrono>
#include "../include/registry.h"
#include "../include/log.h"

namespace lanshare
{
    std::string ServerRegistry::identity(const std::string& address,uint32_t base_port)
    {
        return address + ":" + std::to_string(base_port);
    }

    std::string ServerRegistry::identity(const protocol::ServerRecord& record)
    {
        return identity(record.address(),record.base_port());
    }

    // 单调时钟，系统时间被调整时不会误删或保留记录
    int64_t ServerRegistry::now_ms()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    void ServerRegistry::upsert_announcement(const std::string& address,const protocol::Catalog& catalog,int64_t now)
    {
        std::string id = identity(address,catalog.base_port());
        WriteLockGuard lk(m_rw_mutex);
        auto it = m_servers.find(id);
        if(it==m_servers.end())
        {
            protocol::ServerRecord record;
            record.set_address(address);
            record.set_base_port(catalog.base_port());
            record.set_source(protocol::SOURCE_BROADCAST);
            it = m_servers.insert(std::make_pair(id,record)).first;
            LOG_INFO("Discovered %s (%d entries)",id.c_str(),catalog.entries_size());
        }
        it->second.set_last_seen_ms(now);
        *it->second.mutable_catalog() = catalog;
        it->second.set_catalog_known(true);
    }

    void ServerRegistry::upsert(const protocol::ServerRecord& record)
    {
        std::string id = identity(record);
        WriteLockGuard lk(m_rw_mutex);
        if(m_servers.find(id)==m_servers.end())
        {
            LOG_INFO("Added %s (%d entries)",id.c_str(),record.catalog().entries_size());
        }
        m_servers[id] = record;
    }

    bool ServerRegistry::update_catalog(const std::string& id,const protocol::Catalog& catalog,int64_t now)
    {
        WriteLockGuard lk(m_rw_mutex);
        auto it = m_servers.find(id);
        if(it==m_servers.end()) return false;
        *it->second.mutable_catalog() = catalog;
        it->second.set_catalog_known(true);
        it->second.set_last_seen_ms(now);
        return true;
    }

    bool ServerRegistry::find(const std::string& id,protocol::ServerRecord& out) const
    {
        ReadLockGuard lk(m_rw_mutex);
        auto it = m_servers.find(id);
        if(it==m_servers.end()) return false;
        out = it->second;
        return true;
    }

    std::vector<protocol::ServerRecord> ServerRegistry::snapshot() const
    {
        std::vector<protocol::ServerRecord> result;
        ReadLockGuard lk(m_rw_mutex);
        result.reserve(m_servers.size());
        for(const auto& kv:m_servers)
        {
            result.push_back(kv.second);
        }
        return result;
    }

    size_t ServerRegistry::size() const
    {
        ReadLockGuard lk(m_rw_mutex);
        return m_servers.size();
    }

    size_t ServerRegistry::evict_stale(int64_t now,int64_t window_ms)
    {
        size_t evicted = 0;
        WriteLockGuard lk(m_rw_mutex);
        auto it = m_servers.begin();
        while(it!=m_servers.end())
        {
            // 直接探测得到的记录不会收到广播，不参与过期
            if(it->second.source()==protocol::SOURCE_BROADCAST
                && now - it->second.last_seen_ms() > window_ms
                && m_pinned.find(it->first)==m_pinned.end())
            {
                LOG_INFO("%s went silent, dropped",it->first.c_str());
                it = m_servers.erase(it);
                evicted++;
            }
            else ++it;
        }
        return evicted;
    }

    void ServerRegistry::pin(const std::string& id)
    {
        WriteLockGuard lk(m_rw_mutex);
        m_pinned.insert(id);
    }

    void ServerRegistry::unpin(const std::string& id)
    {
        WriteLockGuard lk(m_rw_mutex);
        m_pinned.erase(id);
    }

    bool ServerRegistry::pinned(const std::string& id) const
    {
        ReadLockGuard lk(m_rw_mutex);
        return m_pinned.find(id)!=m_pinned.end();
    }

    protocol::Registry ServerRegistry::to_protocol() const
    {
        protocol::Registry result;
        ReadLockGuard lk(m_rw_mutex);
        for(const auto& kv:m_servers)
        {
            *result.add_servers() = kv.second;
        }
        return result;
    }
}
