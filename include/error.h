#ifndef __LANSHARE_ERROR_H__
#define __LANSHARE_ERROR_H__

namespace lanshare
{
    enum ErrorCode
    {
        OK=0,
        UNREACHABLE=1,     // 连接服务器失败或超时
        PROTOCOL_ERROR=2,  // 数据格式错误或版本不符
        CONNECT_FAILED=3,  // 下载连接建立失败
        TRANSFER_FAILED=4, // 传输中途读写出错
        CANCELLED=5,
        PORT_IN_USE=6,     // 启动时端口被占用
        INVALID_CATALOG=7  // 条目数量、端口范围或名字不合法
    };

    const char* error_string(ErrorCode code);
}

#endif
