#include "../include/selection.h"

namespace lanshare
{
    SelectionModel::SelectionModel(ServerRegistry& registry)
        :m_registry(registry),m_cursor(0)
    {
    }

    SelectionModel::~SelectionModel()
    {
        if(!m_pinned.empty()) m_registry.unpin(m_pinned);
    }

    void SelectionModel::pin_selected()
    {
        std::string id = m_rows.empty() ? "" : m_rows[m_cursor].identity;
        if(id==m_pinned) return;
        if(!m_pinned.empty()) m_registry.unpin(m_pinned);
        m_pinned = id;
        if(!m_pinned.empty()) m_registry.pin(m_pinned);
    }

    void SelectionModel::reload()
    {
        std::string old_id;
        uint32_t old_port = 0;
        if(!m_rows.empty())
        {
            old_id = m_rows[m_cursor].identity;
            old_port = m_rows[m_cursor].entry.port();
        }

        m_rows.clear();
        for(const auto& server:m_registry.snapshot())
        {
            std::string id = ServerRegistry::identity(server);
            for(const auto& entry:server.catalog().entries())
            {
                SelectionRow row;
                row.identity = id;
                row.server = server;
                row.entry = entry;
                m_rows.push_back(row);
            }
        }

        m_cursor = 0;
        bool found_server = false;
        for(size_t i=0;i<m_rows.size();i++)
        {
            if(m_rows[i].identity!=old_id) continue;
            if(!found_server)
            {
                // 条目没了就停在同一服务器的第一行
                m_cursor = i;
                found_server = true;
            }
            if(m_rows[i].entry.port()==old_port)
            {
                m_cursor = i;
                break;
            }
        }
        pin_selected();
    }

    void SelectionModel::move_up()
    {
        if(m_cursor>0) m_cursor--;
        pin_selected();
    }

    void SelectionModel::move_down()
    {
        if(m_cursor+1<m_rows.size()) m_cursor++;
        pin_selected();
    }

    bool SelectionModel::select(size_t index)
    {
        if(index>=m_rows.size()) return false;
        m_cursor = index;
        pin_selected();
        return true;
    }

    bool SelectionModel::selected(SelectionRow& out) const
    {
        if(m_rows.empty()) return false;
        out = m_rows[m_cursor];
        return true;
    }
}
