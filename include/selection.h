#ifndef __LANSHARE_SELECTION_H__
#define __LANSHARE_SELECTION_H__

#include <string>
#include <vector>
#include "registry.h"
#include "catalog.pb.h"

namespace lanshare
{
    struct SelectionRow
    {
        std::string identity;
        protocol::ServerRecord server;
        protocol::CatalogEntry entry;
    };

    /**
     * 把登记表展开成 (服务器, 条目) 行，服务器按身份排序，条目按目录顺序
     * 光标所在行的服务器被pin住，不会因过期被删除
     */
    class SelectionModel
    {
    private:
        ServerRegistry& m_registry;
        std::vector<SelectionRow> m_rows;
        size_t m_cursor;
        std::string m_pinned;

        void pin_selected();
    public:
        explicit SelectionModel(ServerRegistry& registry);
        ~SelectionModel();

        // 重新从登记表取快照；光标尽量停在原来的行上
        void reload();
        void move_up();
        void move_down();
        bool select(size_t index);

        const std::vector<SelectionRow>& rows() const {return m_rows;};
        size_t cursor() const {return m_cursor;};
        bool empty() const {return m_rows.empty();};
        // 没有任何行时返回false
        bool selected(SelectionRow& out) const;
    };
}

#endif
