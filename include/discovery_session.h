/**
 * 客户端的一次会话：登记表、发现监听、目录获取、下载和选择都挂在这里
 */

#ifndef __LANSHARE_DISCOVERY_SESSION_H__
#define __LANSHARE_DISCOVERY_SESSION_H__

#include <string>
#include <memory>
#include "config.h"
#include "error.h"
#include "registry.h"
#include "discovery_listener.h"
#include "catalog_fetcher.h"
#include "download.h"
#include "selection.h"

namespace lanshare
{
    class DiscoverySession
    {
    private:
        ClientOptions m_options;
        ServerRegistry m_registry;
        DiscoveryListener m_listener;
        CatalogFetcher m_fetcher;
        DirectProbe m_probe;
        DownloadCoordinator m_downloads;
        SelectionModel m_selection;
    public:
        typedef std::shared_ptr<DiscoverySession> session_ptr;
        explicit DiscoverySession(const ClientOptions& options);
        ~DiscoverySession();

        ErrorCode start(); // 开始监听广播，端口绑定失败返回PORT_IN_USE
        void stop();

        // 直接查询host，成功后记录出现在登记表中
        ErrorCode probe(const std::string& host,protocol::ServerRecord& out);
        // 重新获取所有已知服务器的目录，返回成功的个数
        size_t refresh_all();

        // 下载当前选中的条目
        ErrorCode download_selected(std::string& saved_as,ProgressCallback progress=nullptr);
        // 后台下载所有服务器的所有条目，返回开始的个数
        size_t download_all(DownloadCoordinator::DoneCallback done=nullptr);

        bool registry_json(std::string& out) const;

        const ClientOptions& options() const {return m_options;};
        ServerRegistry& registry() {return m_registry;};
        DiscoveryListener& listener() {return m_listener;};
        DownloadCoordinator& downloads() {return m_downloads;};
        SelectionModel& selection() {return m_selection;};
    };
}

#endif
