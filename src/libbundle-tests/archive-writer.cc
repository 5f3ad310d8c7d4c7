#include "charx/bundle/archive-writer.hh"
#include "charx/bundle/archive-reader.hh"
#include "charx/bundle/tests/archives.hh"
#include "charx/store/tests/memory-asset-store.hh"

#include <gtest/gtest.h>

#include <cerrno>

namespace charx {

/* ----------------------------------------------------------------------------
 * sanitizeEntryName
 * --------------------------------------------------------------------------*/

TEST(sanitizeEntryName, replacesInvalidCharacters)
{
    ASSERT_EQ(sanitizeEntryName("a<b>c:d\"e\\f|g?h*i.png"), "a_b_c_d_e_f_g_h_i.png");
    ASSERT_EQ(sanitizeEntryName(std::string_view("tab\there\x01.png", 13)), "tab_here_.png");
}

TEST(sanitizeEntryName, keepsDirectorySeparators)
{
    ASSERT_EQ(sanitizeEntryName("inlays/abc.png"), "inlays/abc.png");
}

TEST(sanitizeEntryName, stripsTrailingDotsAndSpaces)
{
    ASSERT_EQ(sanitizeEntryName("name. . "), "name");
    ASSERT_EQ(sanitizeEntryName("photo.png..."), "photo.png");
}

TEST(sanitizeEntryName, prefixesReservedDeviceNames)
{
    ASSERT_EQ(sanitizeEntryName("CON"), "_CON");
    ASSERT_EQ(sanitizeEntryName("nul.txt"), "_nul.txt");
    ASSERT_EQ(sanitizeEntryName("lpt1.png"), "_lpt1.png");
    ASSERT_EQ(sanitizeEntryName("com9"), "_com9");
    ASSERT_EQ(sanitizeEntryName("com0"), "com0");
    ASSERT_EQ(sanitizeEntryName("console.png"), "console.png");
}

TEST(sanitizeEntryName, emptyResultsBecomeFile)
{
    ASSERT_EQ(sanitizeEntryName(""), "file");
    ASSERT_EQ(sanitizeEntryName("."), "file");
    ASSERT_EQ(sanitizeEntryName(".."), "file");
    ASSERT_EQ(sanitizeEntryName(" . "), "file");
}

TEST(sanitizeEntryName, isIdempotent)
{
    for (auto name : {"CON", "a<b>.png", "x. ", "..", "lpt3.txt", "dir/ok.webp", "weird?*|name", "aux."}) {
        auto once = sanitizeEntryName(name);
        ASSERT_EQ(sanitizeEntryName(once), once) << "for input '" << name << "'";
    }
}

/* ----------------------------------------------------------------------------
 * EntryNameAllocator
 * --------------------------------------------------------------------------*/

TEST(EntryNameAllocator, collisionsGetNumericSuffixBeforeExtension)
{
    EntryNameAllocator names;
    ASSERT_EQ(names.allocate("a.png"), "a.png");
    ASSERT_EQ(names.allocate("a.png"), "a_1.png");
    ASSERT_EQ(names.allocate("a.png"), "a_2.png");
    ASSERT_TRUE(names.isTaken("a_1.png"));
}

TEST(EntryNameAllocator, collisionsAfterSanitising)
{
    EntryNameAllocator names;
    ASSERT_EQ(names.allocate("a?.png"), "a_.png");
    ASSERT_EQ(names.allocate("a*.png"), "a__1.png");
}

TEST(EntryNameAllocator, namesWithoutExtensionAreAllStem)
{
    EntryNameAllocator names;
    ASSERT_EQ(names.allocate("README"), "README");
    ASSERT_EQ(names.allocate("README"), "README_1");
    ASSERT_EQ(names.allocate("dir.d/file"), "dir.d/file");
    ASSERT_EQ(names.allocate("dir.d/file"), "dir.d/file_1");
}

TEST(EntryNameAllocator, skipsSuffixesThatAreAlreadyTaken)
{
    EntryNameAllocator names;
    names.allocate("a_1.png");
    names.allocate("a.png");
    ASSERT_EQ(names.allocate("a.png"), "a_2.png");
}

/* ----------------------------------------------------------------------------
 * ArchiveWriter
 * --------------------------------------------------------------------------*/

TEST(ArchiveWriter, writtenEntriesReadBack)
{
    testing::MemoryAssetStore store;
    auto zip = testing::makeArchive({
        {"card.json", R"({"name":"x"})"},
        {"assets/a.bin", "first"},
        {"assets/a.bin", "second"},
    });

    ArchiveReader reader(store);
    reader.parse(zip);
    reader.done().get();

    ASSERT_EQ(reader.cardData(), R"({"name":"x"})");
    auto assets = reader.assets();
    ASSERT_EQ(assets.size(), 2u);
    ASSERT_EQ(store.load(assets.at("assets/a.bin")), "first");
    ASSERT_EQ(store.load(assets.at("assets/a_1.bin")), "second");
}

TEST(ArchiveWriter, deflatedEntriesReadBack)
{
    testing::MemoryAssetStore store;
    std::string big(100000, 'z');
    auto zip = testing::makeArchive({{"card.json", "{}"}, {"big.bin", big}}, 6);
    ASSERT_LT(zip.size(), big.size());

    ArchiveReader reader(store);
    reader.parse(zip);
    reader.done().get();
    ASSERT_EQ(store.load(reader.assets().at("big.bin")), big);
}

TEST(ArchiveWriter, returnsTheStoredName)
{
    BufferEntrySink sink;
    ArchiveWriter writer(sink);
    ASSERT_EQ(writer.write("a:b.png", "x"), "a_b.png");
    ASSERT_EQ(writer.write("a|b.png", "y"), "a_b_1.png");
    writer.end();
    ASSERT_TRUE(sink.isClosed());
}

TEST(ArchiveWriter, bytesReachTheSinkBeforeWriteReturns)
{
    BufferEntrySink sink;
    ArchiveWriter writer(sink);
    writer.write("a.bin", std::string(1000, 'a'));
    auto afterFirst = sink.bytesWritten();
    ASSERT_GT(afterFirst, 1000u);
    writer.write("b.bin", std::string(1000, 'b'));
    ASSERT_GT(sink.bytesWritten(), afterFirst + 1000);
}

TEST(ArchiveWriter, cannotBeUsedAfterEnd)
{
    BufferEntrySink sink;
    ArchiveWriter writer(sink);
    writer.write("a.bin", "a");
    writer.end();
    ASSERT_THROW(writer.write("b.bin", "b"), ArchiveWriterError);
    ASSERT_THROW(writer.end(), ArchiveWriterError);
}

namespace {

/* Accepts `capacity` bytes, then fails. */
struct FailingEntrySink : EntrySink
{
    size_t capacity;

    explicit FailingEntrySink(size_t capacity)
        : capacity(capacity)
    {
    }

protected:
    void write(std::string_view data) override
    {
        if (data.size() > capacity)
            throw SysError(ENOSPC, "writing archive");
        capacity -= data.size();
    }

    void close() override {}
};

} // namespace

TEST(ArchiveWriter, sinkFailureBreaksTheWriter)
{
    FailingEntrySink sink(100);
    ArchiveWriter writer(sink);
    ASSERT_THROW(writer.write("big.bin", std::string(10000, 'x')), SysError);
    ASSERT_TRUE(writer.isBroken());
    ASSERT_THROW(writer.write("more.bin", "x"), ArchiveWriterError);
    ASSERT_THROW(writer.end(), ArchiveWriterError);
    ASSERT_FALSE(sink.isClosed());
}

} // namespace charx
