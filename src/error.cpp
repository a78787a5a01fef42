#include "../include/error.h"

namespace lanshare
{
    const char* error_string(ErrorCode code)
    {
        switch(code)
        {
            case OK: return "ok";
            case UNREACHABLE: return "server unreachable";
            case PROTOCOL_ERROR: return "protocol error";
            case CONNECT_FAILED: return "connect failed";
            case TRANSFER_FAILED: return "transfer failed";
            case CANCELLED: return "cancelled";
            case PORT_IN_USE: return "port in use";
            case INVALID_CATALOG: return "invalid catalog";
        }
        return "unknown error";
    }
}
