#include "scratchdb/storage_lifecycle.h"

#include <filesystem>
#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/status/status.h"

#include "scratchdb/compression.h"
#include "scratchdb/file_blob_store.h"
#include "scratchdb/guarded_session.h"

namespace scratchdb {
namespace {

using ::testing::HasSubstr;

constexpr char kAgentId[] = "0b8f6d4c-51a2-4a77-9a0e-0c0e7c2d8f11";

TEST(StorageKeyTest, ShardsByIdPrefix) {
  EXPECT_EQ(StorageKey(kAgentId), "agent_state/0b/8f/0b8f6d4c-51a2-4a77-9a0e-0c0e7c2d8f11.db.gz");
  EXPECT_EQ(StorageKey("ab"), "agent_state/ab//ab.db.gz");
}

TEST(CompressionTest, RoundTripsBinary) {
  std::string bytes("SQLite format 3\0\x01\x02\xff", 19);
  bytes += std::string(100000, 'z');
  auto compressed_or = GzipCompress(bytes);
  ASSERT_TRUE(compressed_or.ok()) << compressed_or.status().message();
  EXPECT_LT(compressed_or->size(), bytes.size());
  // gzip magic.
  EXPECT_EQ(static_cast<unsigned char>((*compressed_or)[0]), 0x1f);
  EXPECT_EQ(static_cast<unsigned char>((*compressed_or)[1]), 0x8b);

  auto restored_or = GzipDecompress(*compressed_or);
  ASSERT_TRUE(restored_or.ok()) << restored_or.status().message();
  EXPECT_EQ(*restored_or, bytes);
}

TEST(CompressionTest, RejectsCorruptAndTruncatedInput) {
  EXPECT_TRUE(absl::IsDataLoss(GzipDecompress("definitely not gzip").status()));

  auto compressed_or = GzipCompress(std::string(5000, 'q'));
  ASSERT_TRUE(compressed_or.ok());
  std::string truncated = compressed_or->substr(0, compressed_or->size() / 2);
  absl::Status status = GzipDecompress(truncated).status();
  EXPECT_TRUE(absl::IsDataLoss(status));
  EXPECT_THAT(status.message(), HasSubstr("Truncated"));
}

TEST(CompressionTest, StopsAtOutputLimit) {
  auto compressed_or = GzipCompress(std::string(4 * 1024 * 1024, 'a'));
  ASSERT_TRUE(compressed_or.ok());
  EXPECT_LT(compressed_or->size(), 64u * 1024);

  absl::Status status = GzipDecompress(*compressed_or, 100000).status();
  EXPECT_TRUE(absl::IsDataLoss(status));
  EXPECT_THAT(status.message(), HasSubstr("exceeds 100000 bytes"));

  auto exact_or = GzipDecompress(*compressed_or, 4 * 1024 * 1024);
  ASSERT_TRUE(exact_or.ok()) << exact_or.status().message();
  EXPECT_EQ(exact_or->size(), 4u * 1024 * 1024);
}

class FileBlobStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto dir_or = ScratchDatabase::Create("blobs");
    ASSERT_TRUE(dir_or.ok()) << dir_or.status().message();
    dir_ = std::move(*dir_or);
    store_ = std::make_unique<FileBlobStore>(dir_->directory());
  }

  std::unique_ptr<ScratchDatabase> dir_;
  std::unique_ptr<FileBlobStore> store_;
};

TEST_F(FileBlobStoreTest, PutGetDelete) {
  auto exists_or = store_->Exists("a/b/c.bin");
  ASSERT_TRUE(exists_or.ok());
  EXPECT_FALSE(*exists_or);
  EXPECT_TRUE(absl::IsNotFound(store_->Get("a/b/c.bin").status()));

  ASSERT_TRUE(store_->Put("a/b/c.bin", "first").ok());
  ASSERT_TRUE(store_->Put("a/b/c.bin", "second").ok());
  auto bytes_or = store_->Get("a/b/c.bin");
  ASSERT_TRUE(bytes_or.ok());
  EXPECT_EQ(*bytes_or, "second");

  ASSERT_TRUE(store_->Delete("a/b/c.bin").ok());
  exists_or = store_->Exists("a/b/c.bin");
  ASSERT_TRUE(exists_or.ok());
  EXPECT_FALSE(*exists_or);
  EXPECT_TRUE(store_->Delete("a/b/c.bin").ok());
}

TEST_F(FileBlobStoreTest, RejectsEscapingKeys) {
  EXPECT_TRUE(absl::IsInvalidArgument(store_->Put("/etc/passwd", "x")));
  EXPECT_TRUE(absl::IsInvalidArgument(store_->Put("a/../../escape", "x")));
  EXPECT_TRUE(absl::IsInvalidArgument(store_->Get("").status()));
}

class StorageLifecycleTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto dir_or = ScratchDatabase::Create("blobs");
    ASSERT_TRUE(dir_or.ok()) << dir_or.status().message();
    blob_dir_ = std::move(*dir_or);
    blobs_ = std::make_unique<FileBlobStore>(blob_dir_->directory());
  }

  std::unique_ptr<ScratchDatabase> Restore() {
    StorageLifecycle lifecycle(blobs_.get(), config_);
    auto database_or = lifecycle.Restore(kAgentId);
    EXPECT_TRUE(database_or.ok()) << database_or.status().message();
    return database_or.ok() ? std::move(*database_or) : nullptr;
  }

  void Exec(ScratchDatabase* database, const std::string& sql) {
    auto session_or = GuardedSession::Open(database->path());
    ASSERT_TRUE(session_or.ok()) << session_or.status().message();
    absl::Status status = (*session_or)->ExecuteScript(sql);
    ASSERT_TRUE(status.ok()) << status.message();
  }

  bool HasTable(ScratchDatabase* database, const std::string& table) {
    auto session_or = GuardedSession::Open(database->path());
    EXPECT_TRUE(session_or.ok());
    if (!session_or.ok()) return false;
    auto exists_or = (*session_or)->TableExists(table);
    return exists_or.ok() && *exists_or;
  }

  bool ArchiveExists() {
    auto exists_or = blobs_->Exists(StorageKey(kAgentId));
    return exists_or.ok() && *exists_or;
  }

  Config config_;
  std::unique_ptr<ScratchDatabase> blob_dir_;
  std::unique_ptr<FileBlobStore> blobs_;
};

TEST_F(StorageLifecycleTest, NoArchiveStartsEmpty) {
  auto database = Restore();
  ASSERT_NE(database, nullptr);
  EXPECT_FALSE(std::filesystem::exists(database->path()));
  EXPECT_FALSE(database->released());
}

TEST_F(StorageLifecycleTest, PersistThenRestore) {
  {
    auto database = Restore();
    ASSERT_NE(database, nullptr);
    Exec(database.get(), "CREATE TABLE notes (body TEXT); INSERT INTO notes VALUES ('remember me');"
                         "CREATE TABLE __kanban_cards (id TEXT);");
    StorageLifecycle lifecycle(blobs_.get(), config_);
    EXPECT_EQ(lifecycle.Persist(kAgentId, database.get()), PersistOutcome::kPersisted);
    EXPECT_TRUE(database->released());
  }
  EXPECT_TRUE(ArchiveExists());

  auto database = Restore();
  ASSERT_NE(database, nullptr);
  EXPECT_TRUE(HasTable(database.get(), "notes"));
  EXPECT_FALSE(HasTable(database.get(), "__kanban_cards"));
  auto session_or = GuardedSession::Open(database->path());
  ASSERT_TRUE(session_or.ok());
  auto count_or = (*session_or)->QueryInt64("SELECT COUNT(*) FROM notes WHERE body = 'remember me'");
  ASSERT_TRUE(count_or.ok());
  EXPECT_EQ(*count_or, 1);
}

TEST_F(StorageLifecycleTest, CorruptArchiveRestoresEmpty) {
  ASSERT_TRUE(blobs_->Put(StorageKey(kAgentId), "garbage").ok());
  auto database = Restore();
  ASSERT_NE(database, nullptr);
  EXPECT_FALSE(std::filesystem::exists(database->path()));
}

TEST_F(StorageLifecycleTest, NonSqlitePayloadRestoresEmpty) {
  auto archive_or = GzipCompress("hello, not a database");
  ASSERT_TRUE(archive_or.ok());
  ASSERT_TRUE(blobs_->Put(StorageKey(kAgentId), *archive_or).ok());
  auto database = Restore();
  ASSERT_NE(database, nullptr);
  EXPECT_FALSE(std::filesystem::exists(database->path()));
}

TEST_F(StorageLifecycleTest, ArchiveExpandingPastLimitRestoresEmpty) {
  std::string payload = "SQLite format 3";
  payload.push_back('\0');
  payload += std::string(3 * 1024 * 1024, '\0');
  auto archive_or = GzipCompress(payload);
  ASSERT_TRUE(archive_or.ok());
  ASSERT_TRUE(blobs_->Put(StorageKey(kAgentId), *archive_or).ok());

  config_.hard_size_bytes = 1024;
  auto database = Restore();
  ASSERT_NE(database, nullptr);
  EXPECT_FALSE(std::filesystem::exists(database->path()));
}

TEST_F(StorageLifecycleTest, OversizedDatabaseIsWiped) {
  ASSERT_TRUE(blobs_->Put(StorageKey(kAgentId), "previous archive").ok());
  auto database = Restore();
  ASSERT_NE(database, nullptr);
  // The previous archive is not a valid gzip stream, so the cycle starts fresh.
  Exec(database.get(), "CREATE TABLE notes (body TEXT); INSERT INTO notes VALUES ('x');");

  config_.soft_size_bytes = 1;
  config_.hard_size_bytes = 1;
  StorageLifecycle lifecycle(blobs_.get(), config_);
  EXPECT_EQ(lifecycle.Persist(kAgentId, database.get()), PersistOutcome::kWiped);
  EXPECT_FALSE(ArchiveExists());

  config_ = Config();
  auto fresh = Restore();
  ASSERT_NE(fresh, nullptr);
  EXPECT_FALSE(std::filesystem::exists(fresh->path()));
}

TEST_F(StorageLifecycleTest, MissingFileIsSkipped) {
  auto database = Restore();
  ASSERT_NE(database, nullptr);
  StorageLifecycle lifecycle(blobs_.get(), config_);
  EXPECT_EQ(lifecycle.Persist(kAgentId, database.get()), PersistOutcome::kSkipped);
  EXPECT_TRUE(database->released());
  EXPECT_FALSE(ArchiveExists());
  EXPECT_STREQ(PersistOutcomeName(PersistOutcome::kSkipped), "skipped");
}

TEST_F(StorageLifecycleTest, ScratchDirectoryRemovedWithDatabase) {
  std::string directory;
  {
    auto database = Restore();
    ASSERT_NE(database, nullptr);
    directory = database->directory();
    Exec(database.get(), "CREATE TABLE t (a);");
    EXPECT_TRUE(std::filesystem::exists(database->path()));
  }
  EXPECT_FALSE(std::filesystem::exists(directory));
}

}  // namespace
}  // namespace scratchdb
