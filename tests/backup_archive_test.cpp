#include <gtest/gtest.h>
#include <archive.h>
#include <archive_entry.h>
#include <set>
#include "backup_archive.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace {

std::set<std::string> archiveEntries(const fs::path& file) {
    std::set<std::string> names;
    struct archive* a = archive_read_new();
    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);
    if (archive_read_open_filename(a, file.c_str(), 10240) == ARCHIVE_OK) {
        struct archive_entry* entry;
        while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
            names.insert(archive_entry_pathname(entry));
            archive_read_data_skip(a);
        }
    }
    archive_read_free(a);
    return names;
}

} // namespace

TEST(BackupArchiveTest, ArchivesNestedTreeWithRelativeNames) {
    TempDir dir;
    auto run = dir.path() / "run";
    fs::create_directories(run / "events");
    std::ofstream(run / "shop.sql") << "CREATE TABLE t (id INT);\n";
    std::ofstream(run / "events" / "orders.bson.gz") << "bson";

    auto archive = dir.path() / "backup.tar.gz";
    auto packed = compressDirectory(run, archive);
    ASSERT_TRUE(packed) << packed.error().what();

    auto entries = verifyArchive(archive);
    ASSERT_TRUE(entries) << entries.error().what();
    EXPECT_EQ(*entries, 3u);

    auto names = archiveEntries(archive);
    EXPECT_TRUE(names.count("shop.sql"));
    EXPECT_TRUE(names.count("events/orders.bson.gz"));
    for (const auto& name : names) {
        EXPECT_NE(name.front(), '/') << name;
    }
}

TEST(BackupArchiveTest, MissingSourceFailsAndLeavesNoOutput) {
    TempDir dir;
    auto archive = dir.path() / "backup.tar.gz";
    auto packed = compressDirectory(dir.path() / "absent", archive);
    ASSERT_FALSE(packed);
    EXPECT_EQ(packed.error().kind(), ErrorKind::Backup);
    EXPECT_FALSE(fs::exists(archive));
}

TEST(BackupArchiveTest, VerifyRejectsGarbage) {
    TempDir dir;
    auto file = dir.path() / "broken.tar.gz";
    std::ofstream(file, std::ios::binary) << std::string(4096, '\x1f');
    auto entries = verifyArchive(file);
    ASSERT_FALSE(entries);
    EXPECT_EQ(entries.error().kind(), ErrorKind::Backup);
}
