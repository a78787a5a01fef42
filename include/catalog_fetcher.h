#ifndef __LANSHARE_CATALOG_FETCHER_H__
#define __LANSHARE_CATALOG_FETCHER_H__

#include <string>
#include "error.h"
#include "registry.h"
#include "catalog.pb.h"

namespace lanshare
{
    /**
     * 连接服务器的base_port，读到对方关闭为止，解析出完整目录
     * 连接失败或超时返回UNREACHABLE，内容无法解析返回PROTOCOL_ERROR
     */
    class CatalogFetcher
    {
    private:
        int m_timeout_ms;
    public:
        explicit CatalogFetcher(int timeout_ms):m_timeout_ms(timeout_ms){};
        ErrorCode fetch(const std::string& address,uint16_t base_port,protocol::Catalog& out);
        // 重新获取登记表中某个服务器的目录并替换
        ErrorCode refresh(ServerRegistry& registry,const std::string& id);
    };

    class DirectProbe
    {
    private:
        CatalogFetcher m_fetcher;
    public:
        explicit DirectProbe(int timeout_ms):m_fetcher(timeout_ms){};
        // host可以是ip或主机名；成功时把记录写入登记表，不重试
        ErrorCode probe(const std::string& host,uint16_t base_port,ServerRegistry& registry,protocol::ServerRecord& out);
    };
}

#endif
