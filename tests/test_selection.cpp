#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "../include/selection.h"

using namespace lanshare;

static protocol::Catalog catalog_of(uint32_t base_port,const std::vector<std::string>& names)
{
    protocol::Catalog catalog;
    catalog.set_base_port(base_port);
    for(size_t i=0;i<names.size();i++)
    {
        protocol::CatalogEntry* entry = catalog.add_entries();
        entry->set_name(names[i]);
        entry->set_port(base_port+1+i);
    }
    return catalog;
}

TEST(SelectionTest, RowsFollowIdentityThenCatalogOrder)
{
    ServerRegistry registry;
    registry.upsert_announcement("10.0.0.2",catalog_of(1337,{"z"}),1000);
    registry.upsert_announcement("10.0.0.1",catalog_of(1337,{"b","a"}),1000);

    SelectionModel selection(registry);
    selection.reload();
    const std::vector<SelectionRow>& rows = selection.rows();
    ASSERT_EQ(3u,rows.size());
    EXPECT_EQ("10.0.0.1:1337",rows[0].identity);
    EXPECT_EQ("b",rows[0].entry.name());
    EXPECT_EQ("a",rows[1].entry.name());
    EXPECT_EQ("10.0.0.2:1337",rows[2].identity);
}

TEST(SelectionTest, CursorClampsAtBothEnds)
{
    ServerRegistry registry;
    registry.upsert_announcement("10.0.0.1",catalog_of(1337,{"a","b"}),1000);
    SelectionModel selection(registry);
    selection.reload();

    selection.move_up();
    EXPECT_EQ(0u,selection.cursor());
    selection.move_down();
    selection.move_down();
    selection.move_down();
    EXPECT_EQ(1u,selection.cursor());

    SelectionRow row;
    ASSERT_TRUE(selection.selected(row));
    EXPECT_EQ("b",row.entry.name());
    EXPECT_EQ(1339u,row.entry.port());
}

TEST(SelectionTest, SelectByIndex)
{
    ServerRegistry registry;
    registry.upsert_announcement("10.0.0.1",catalog_of(1337,{"a","b","c"}),1000);
    SelectionModel selection(registry);
    selection.reload();
    EXPECT_TRUE(selection.select(2));
    EXPECT_FALSE(selection.select(3));
    EXPECT_EQ(2u,selection.cursor());
}

TEST(SelectionTest, EmptyRegistryHasNoSelection)
{
    ServerRegistry registry;
    SelectionModel selection(registry);
    selection.reload();
    selection.move_down();
    SelectionRow row;
    EXPECT_TRUE(selection.empty());
    EXPECT_FALSE(selection.selected(row));
}

TEST(SelectionTest, ReloadKeepsCursorOnSameRow)
{
    ServerRegistry registry;
    registry.upsert_announcement("10.0.0.5",catalog_of(1337,{"a","b"}),1000);
    SelectionModel selection(registry);
    selection.reload();
    selection.move_down();

    // 前面插入一个服务器，光标仍在 10.0.0.5 的 b 上
    registry.upsert_announcement("10.0.0.1",catalog_of(1337,{"x","y"}),1000);
    selection.reload();
    SelectionRow row;
    ASSERT_TRUE(selection.selected(row));
    EXPECT_EQ("10.0.0.5:1337",row.identity);
    EXPECT_EQ("b",row.entry.name());
    EXPECT_EQ(3u,selection.cursor());
}

TEST(SelectionTest, SelectedServerIsPinned)
{
    ServerRegistry registry;
    registry.upsert_announcement("10.0.0.1",catalog_of(1337,{"a"}),1000);
    registry.upsert_announcement("10.0.0.2",catalog_of(1337,{"b"}),1000);
    {
        SelectionModel selection(registry);
        selection.reload();
        EXPECT_TRUE(registry.pinned("10.0.0.1:1337"));
        selection.move_down();
        EXPECT_FALSE(registry.pinned("10.0.0.1:1337"));
        EXPECT_TRUE(registry.pinned("10.0.0.2:1337"));

        EXPECT_EQ(1u,registry.evict_stale(100000,5000));
        EXPECT_EQ(1u,registry.size());
    }
    EXPECT_FALSE(registry.pinned("10.0.0.2:1337"));
}
