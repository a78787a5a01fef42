/**
 * 广播报文与目录查询响应的编解码
 *
 * 广播: magic(4B) | version(1B) | basePort(2B) | entryCount(1B) | entries
 * 查询响应: entryCount(1B) | entries
 * entry: kind(1B) | nameLen(1B) | name
 * 多字节整数均为网络字节序
 */

#ifndef __LANSHARE_WIRE_H__
#define __LANSHARE_WIRE_H__

#include <string>
#include <cstddef>
#include <cstdint>
#include "error.h"
#include "catalog.pb.h"

#define LANSHARE_MAGIC "LSHR"
#define LANSHARE_MAGIC_LEN 4
#define LANSHARE_PROTOCOL_VERSION 1
#define LANSHARE_ANNOUNCE_HEADER_LEN 7 // magic + version + basePort

namespace lanshare
{
    // 广播报文不超过max_bytes，放不下时只带最长的前缀
    std::string encode_announcement(const protocol::Catalog& catalog,size_t max_bytes);
    std::string encode_catalog_response(const protocol::Catalog& catalog);

    // 成功时out包含base_port和按下标推出的端口
    ErrorCode decode_announcement(const char* data,size_t length,protocol::Catalog& out);
    ErrorCode decode_catalog_response(const char* data,size_t length,uint16_t base_port,protocol::Catalog& out);
}

#endif
