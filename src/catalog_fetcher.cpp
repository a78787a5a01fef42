#include <cerrno>
#include "../include/catalog_fetcher.h"
#include "../include/socket.h"
#include "../include/wire.h"
#include "../include/config.h"
#include "../include/log.h"

namespace lanshare
{
    ErrorCode CatalogFetcher::fetch(const std::string& address,uint16_t base_port,protocol::Catalog& out)
    {
        IPAddress::ipaddr_ptr addr = IPAddress::Resolve(address.c_str(),base_port);
        if(!addr) return UNREACHABLE;

        Socket::socket_ptr sock = Socket::create_tcp_socket();
        if(!sock->connect(addr,m_timeout_ms))
        {
            LOG_WARN("cannot reach %s:%u: %s",address.c_str(),base_port,strerror(errno));
            return UNREACHABLE;
        }
        if(!sock->set_recv_timeout(m_timeout_ms)) return UNREACHABLE;

        // 请求为空，直接读到对方关闭
        std::string response;
        char buffer[LANSHARE_CHUNK_SIZE];
        while(true)
        {
            int n = sock->recv(buffer,sizeof(buffer),0);
            if(n==0) break;
            if(n<0)
            {
                LOG_WARN("reading file list from %s:%u failed: %s",address.c_str(),base_port,strerror(errno));
                return UNREACHABLE;
            }
            response.append(buffer,n);
            if(response.size() > LANSHARE_MAX_CATALOG_RESPONSE)
            {
                LOG_WARN("file list from %s:%u is too large",address.c_str(),base_port);
                return PROTOCOL_ERROR;
            }
        }
        sock->close();

        ErrorCode rt = decode_catalog_response(response.data(),response.size(),base_port,out);
        if(rt!=OK)
        {
            LOG_WARN("bogus file list from %s:%u (%zu bytes)",address.c_str(),base_port,response.size());
            return rt;
        }
        LOG_DEBUG("Received file list from %s:%u, %d entries",address.c_str(),base_port,out.entries_size());
        return OK;
    }

    ErrorCode CatalogFetcher::refresh(ServerRegistry& registry,const std::string& id)
    {
        protocol::ServerRecord record;
        if(!registry.find(id,record)) return UNREACHABLE;
        protocol::Catalog catalog;
        ErrorCode rt = fetch(record.address(),(uint16_t)record.base_port(),catalog);
        if(rt!=OK) return rt;
        // 刷新期间记录可能已过期被删除
        if(!registry.update_catalog(id,catalog,ServerRegistry::now_ms())) return UNREACHABLE;
        return OK;
    }

    ErrorCode DirectProbe::probe(const std::string& host,uint16_t base_port,ServerRegistry& registry,protocol::ServerRecord& out)
    {
        IPAddress::ipaddr_ptr addr = IPAddress::Resolve(host.c_str(),base_port);
        if(!addr) return UNREACHABLE;
        // 用数字地址作为身份，和广播发现的记录一致
        std::string address = addr->to_string();

        protocol::Catalog catalog;
        ErrorCode rt = m_fetcher.fetch(address,base_port,catalog);
        if(rt!=OK) return rt;

        protocol::ServerRecord record;
        record.set_address(address);
        record.set_base_port(base_port);
        record.set_last_seen_ms(ServerRegistry::now_ms());
        *record.mutable_catalog() = catalog;
        record.set_catalog_known(true);
        record.set_source(protocol::SOURCE_PROBE);
        registry.upsert(record);
        out = record;
        return OK;
    }
}
