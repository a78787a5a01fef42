/**
* 默认配置，命令行参数可覆盖
**/

#ifndef __LANSHARE_CONFIG_H__
#define __LANSHARE_CONFIG_H__

#include <string>
#include <vector>
#include <cstdint>

#define LANSHARE_DEFAULT_PORT 1337           // basePort，目录查询端口
#define LANSHARE_DEFAULT_DISCOVERY_PORT 1337 // UDP广播端口
#define LANSHARE_BROADCAST_ADDR "255.255.255.255"
#define LANSHARE_ANNOUNCE_INTERVAL_MS 1000
#define LANSHARE_STALE_WINDOW_MS 10000
#define LANSHARE_TIMEOUT_MS 3000
#define LANSHARE_CHUNK_SIZE 4096             // 每次读写的块大小
#define LANSHARE_MAX_DATAGRAM 1472           // 单个以太网帧能容纳的UDP载荷
#define LANSHARE_MAX_CATALOG_RESPONSE (64*1024)
#define LANSHARE_POOL_THREADS 4
#define LANSHARE_POOL_IDLE_MS 30000
#define LANSHARE_PROGRESS_INTERVAL_MS 100
#define LANSHARE_TRANSFER_IDLE_MS 60000     // 下载中途无数据的最长时间

namespace lanshare
{
    struct ServerOptions
    {
        uint16_t base_port = LANSHARE_DEFAULT_PORT;
        uint16_t discovery_port = LANSHARE_DEFAULT_DISCOVERY_PORT;
        int announce_interval_ms = LANSHARE_ANNOUNCE_INTERVAL_MS;
        std::vector<std::string> broadcast_addrs; // 为空时使用 255.255.255.255 加各网卡的广播地址
        std::vector<std::string> paths;
        bool verbose = false;
    };

    struct ClientOptions
    {
        uint16_t base_port = LANSHARE_DEFAULT_PORT;
        uint16_t discovery_port = LANSHARE_DEFAULT_DISCOVERY_PORT;
        int timeout_ms = LANSHARE_TIMEOUT_MS;
        int stale_window_ms = LANSHARE_STALE_WINDOW_MS;
        std::string host; // 为空时只依赖广播发现
        std::string out_dir = ".";
        bool list_only = false;
        bool verbose = false;
    };
}

#endif
