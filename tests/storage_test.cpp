#include <gtest/gtest.h>
#include "backup_archive.hpp"
#include "storage.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace {

/**
 * @brief Transfer strategy copying into a local directory instead of a remote host.
 */
class RecordingTransfer : public RemoteTransferStrategy {
public:
    explicit RecordingTransfer(fs::path target, bool fail = false) : target(std::move(target)), fail(fail) {}

    Result<void> transfer(const fs::path& localFile, const std::string& remotePath) override {
        remotePaths.push_back(remotePath);
        if (fail) {
            return std::unexpected(BackupError::storage("SSH connection to vault:22 failed: Connection refused"));
        }
        fs::copy_file(localFile, target / localFile.filename(), fs::copy_options::overwrite_existing);
        return {};
    }

    fs::path target;
    bool fail;
    std::vector<std::string> remotePaths;
};

fs::path makeRunDirectory(const fs::path& base) {
    auto run = base / "staging" / "backup-20240101T000000";
    fs::create_directories(run);
    std::ofstream(run / "shop.sql") << "-- dump\n";
    return run;
}

} // namespace

TEST(LocalStorageTest, StoresVerifiedArchiveUnderBasePath) {
    TempDir dir;
    auto run = makeRunDirectory(dir.path());
    LocalStorage storage(dir.path() / "archives");
    auto stored = storage.store(run, "backup-20240101T000000");
    ASSERT_TRUE(stored) << stored.error().what();

    auto archive = dir.path() / "archives" / "backup-20240101T000000.tar.gz";
    EXPECT_EQ(*stored, archive.string());
    EXPECT_TRUE(fs::exists(archive));
    EXPECT_FALSE(fs::exists(archive.string() + ".partial"));
    auto entries = verifyArchive(archive);
    ASSERT_TRUE(entries);
    EXPECT_EQ(*entries, 1u);
}

TEST(LocalStorageTest, MissingRunDirectoryIsStorageError) {
    TempDir dir;
    LocalStorage storage(dir.path() / "archives");
    auto stored = storage.store(dir.path() / "absent", "backup-20240101T000000");
    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error().kind(), ErrorKind::Storage);
    EXPECT_FALSE(fs::exists(dir.path() / "archives" / "backup-20240101T000000.tar.gz"));
}

TEST(SFTPStorageTest, UploadsArchiveAndRemovesLocalCopy) {
    TempDir dir;
    TempDir remote;
    auto run = makeRunDirectory(dir.path());
    auto transfer = std::make_unique<RecordingTransfer>(remote.path());
    auto* recorder = transfer.get();
    SFTPStorage storage("/srv/backups", std::move(transfer));

    auto stored = storage.store(run, "backup-20240101T000000");
    ASSERT_TRUE(stored) << stored.error().what();
    EXPECT_EQ(*stored, "/srv/backups/backup-20240101T000000.tar.gz");
    EXPECT_EQ(recorder->remotePaths, (std::vector<std::string>{"/srv/backups"}));
    EXPECT_TRUE(fs::exists(remote.path() / "backup-20240101T000000.tar.gz"));
    EXPECT_FALSE(fs::exists(run.parent_path() / "backup-20240101T000000.tar.gz"));
}

TEST(SFTPStorageTest, TransferFailureIsReported) {
    TempDir dir;
    auto run = makeRunDirectory(dir.path());
    SFTPStorage storage("/srv/backups", std::make_unique<RecordingTransfer>(dir.path(), true));
    auto stored = storage.store(run, "backup-20240101T000000");
    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error().kind(), ErrorKind::Storage);
    EXPECT_FALSE(fs::exists(run.parent_path() / "backup-20240101T000000.tar.gz"));
}

TEST(StorageFactoryTest, SelectsSinkByType) {
    StorageConfig local;
    local.path = "/tmp/kronvault";
    auto localSink = createStorageSink(local);
    ASSERT_TRUE(localSink);
    EXPECT_NE(dynamic_cast<LocalStorage*>(localSink->get()), nullptr);

    StorageConfig sftp;
    sftp.type = "sftp";
    sftp.host = "vault";
    sftp.user = "backup";
    sftp.remoteDir = "/srv/backups";
    auto sftpSink = createStorageSink(sftp);
    ASSERT_TRUE(sftpSink);
    EXPECT_NE(dynamic_cast<SFTPStorage*>(sftpSink->get()), nullptr);

    StorageConfig unknown;
    unknown.type = "s3";
    auto unknownSink = createStorageSink(unknown);
    ASSERT_FALSE(unknownSink);
    EXPECT_EQ(unknownSink.error().kind(), ErrorKind::Config);
}
