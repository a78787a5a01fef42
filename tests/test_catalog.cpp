#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>
#include <sys/stat.h>
#include "../include/catalog.h"

using namespace lanshare;

static ByteSource::source_ptr no_source()
{
    return nullptr;
}

TEST(ItemCatalogTest, PortsAreContiguousAfterBasePort)
{
    ItemCatalog catalog(4000);
    ASSERT_EQ(OK,catalog.add_item("foo",protocol::ENTRY_FILE,no_source));
    ASSERT_EQ(OK,catalog.add_item("bar",protocol::ENTRY_FILE,no_source));
    ASSERT_EQ(OK,catalog.add_item("baz",protocol::ENTRY_DIRECTORY,no_source));

    protocol::Catalog proto = catalog.to_protocol();
    EXPECT_EQ(4000u,proto.base_port());
    ASSERT_EQ(3,proto.entries_size());
    for(int i=0;i<proto.entries_size();i++)
    {
        EXPECT_EQ(4001u+i,proto.entries(i).port());
    }
    EXPECT_EQ("foo",proto.entries(0).name());
    EXPECT_EQ(protocol::ENTRY_DIRECTORY,proto.entries(2).kind());
}

TEST(ItemCatalogTest, BoundsRejectTooManyEntries)
{
    EXPECT_EQ(OK,ItemCatalog::check_bounds(1337,255));
    EXPECT_EQ(INVALID_CATALOG,ItemCatalog::check_bounds(1337,256));
    EXPECT_EQ(OK,ItemCatalog::check_bounds(1337,0));
}

TEST(ItemCatalogTest, BoundsRejectPortOverflow)
{
    EXPECT_EQ(OK,ItemCatalog::check_bounds(65534,1));
    EXPECT_EQ(INVALID_CATALOG,ItemCatalog::check_bounds(65535,1));

    ItemCatalog catalog(65534);
    EXPECT_EQ(OK,catalog.add_item("a",protocol::ENTRY_FILE,no_source));
    EXPECT_EQ(INVALID_CATALOG,catalog.add_item("b",protocol::ENTRY_FILE,no_source));
    EXPECT_EQ(1u,catalog.size());
}

TEST(ItemCatalogTest, NamesAreValidated)
{
    EXPECT_TRUE(ItemCatalog::valid_name("report.pdf"));
    EXPECT_FALSE(ItemCatalog::valid_name(""));
    EXPECT_FALSE(ItemCatalog::valid_name("a/b"));
    EXPECT_FALSE(ItemCatalog::valid_name(std::string(256,'x')));
    EXPECT_TRUE(ItemCatalog::valid_name(std::string(255,'x')));
}

TEST(ItemCatalogTest, AddPathUsesBaseNameAndKind)
{
    char tmpl[] = "/tmp/lanshare_catalogXXXXXX";
    ASSERT_NE(nullptr,mkdtemp(tmpl));
    std::string root = tmpl;
    std::string file = root + "/hello.txt";
    FILE* fp = fopen(file.c_str(),"wb");
    ASSERT_NE(nullptr,fp);
    fputs("hello",fp);
    fclose(fp);
    std::string dir = root + "/photos";
    ASSERT_EQ(0,mkdir(dir.c_str(),0755));

    ItemCatalog catalog(5000);
    EXPECT_EQ(OK,catalog.add_path(file));
    EXPECT_EQ(OK,catalog.add_path(dir + "/"));
    EXPECT_EQ(INVALID_CATALOG,catalog.add_path(root + "/missing"));
    ASSERT_EQ(2u,catalog.size());
    EXPECT_EQ("hello.txt",catalog.item(0).entry.name());
    EXPECT_EQ(protocol::ENTRY_FILE,catalog.item(0).entry.kind());
    EXPECT_EQ("photos",catalog.item(1).entry.name());
    EXPECT_EQ(protocol::ENTRY_DIRECTORY,catalog.item(1).entry.kind());
    // 服务器启动时按本地路径列出
    EXPECT_EQ(file,catalog.item(0).path);
    EXPECT_EQ(dir + "/",catalog.item(1).path);

    // 每次打开都是新的字节流
    ByteSource::source_ptr a = catalog.item(0).open();
    ByteSource::source_ptr b = catalog.item(0).open();
    ASSERT_TRUE(a && b);
    char buffer[16];
    EXPECT_EQ(5,a->read(buffer,sizeof(buffer)));
    EXPECT_EQ(5,b->read(buffer,sizeof(buffer)));
    EXPECT_EQ(0,a->read(buffer,sizeof(buffer)));

    unlink(file.c_str());
    rmdir(dir.c_str());
    rmdir(root.c_str());
}
