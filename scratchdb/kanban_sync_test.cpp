#include "scratchdb/kanban_sync.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/strings/str_cat.h"

#include "scratchdb/guarded_session.h"
#include "scratchdb/sqlite_record_store.h"

namespace scratchdb {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

constexpr char kCardA[] = "11111111-1111-1111-1111-111111111111";
constexpr char kCardB[] = "22222222-2222-2222-2222-222222222222";
constexpr char kCardOther[] = "33333333-3333-3333-3333-333333333333";

TEST(KanbanFriendlyIdTest, Slugifies) {
  EXPECT_EQ(FormatKanbanFriendlyId("Fix login bug"), "fix-login-bug");
  EXPECT_EQ(FormatKanbanFriendlyId("  Hello, World!  "), "hello-world");
  EXPECT_EQ(FormatKanbanFriendlyId("Q3 -- plan"), "q3-plan");
  EXPECT_EQ(FormatKanbanFriendlyId("!!!", "0123abcd-0000-0000-0000-000000000000"), "card-0123abcd");
  EXPECT_EQ(FormatKanbanFriendlyId(""), "card");
}

TEST(KanbanCardIdTest, Canonicalizes) {
  EXPECT_EQ(CanonicalCardId("0123456789ABCDEF0123456789abcdef"), "01234567-89ab-cdef-0123-456789abcdef");
  EXPECT_EQ(CanonicalCardId("{01234567-89ab-cdef-0123-456789abcdef}"), "01234567-89ab-cdef-0123-456789abcdef");
  EXPECT_EQ(CanonicalCardId("urn:uuid:01234567-89ab-cdef-0123-456789abcdef"),
            "01234567-89ab-cdef-0123-456789abcdef");
  EXPECT_FALSE(CanonicalCardId("not-a-card").has_value());
  EXPECT_FALSE(CanonicalCardId("0123456789abcdef").has_value());
  EXPECT_FALSE(CanonicalCardId("{0123456789abcdef0123456789abcdef").has_value());
}

class KanbanSyncTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(store_.Init(":memory:").ok());
    agent_ = {"agent-1", "org-1", "user-1"};
    ASSERT_TRUE(store_.UpsertAgent(agent_).ok());
    ASSERT_TRUE(store_.InsertCard(Card(kCardA, "Draft outline", kCardStatusTodo, "agent-1", 2)).ok());
    ASSERT_TRUE(store_.InsertCard(Card(kCardB, "Collect sources", kCardStatusDone, "agent-1", 1)).ok());
    ASSERT_TRUE(store_.InsertCard(Card(kCardOther, "Someone else's task", kCardStatusDoing, "agent-2", 0)).ok());

    auto session_or = GuardedSession::Open(":memory:");
    ASSERT_TRUE(session_or.ok()) << session_or.status().message();
    session_ = std::move(*session_or);
    sync_ = std::make_unique<KanbanSync>(session_.get(), &store_, agent_, KanbanDomain(&store_, agent_));
    ASSERT_TRUE(sync_->Seed().ok());
  }

  static KanbanCard Card(const std::string& id, const std::string& title, const std::string& status,
                         const std::string& owner, int64_t priority) {
    KanbanCard card;
    card.id = id;
    card.title = title;
    card.friendly_id = FormatKanbanFriendlyId(title, id);
    card.status = status;
    card.assigned_agent_id = owner;
    card.organization_id = "org-1";
    card.user_id = "user-1";
    card.priority = priority;
    card.created_at = "2024-01-01T00:00:00Z";
    card.updated_at = card.created_at;
    if (status == kCardStatusDone) card.completed_at = card.created_at;
    return card;
  }

  void Exec(const std::string& sql) {
    absl::Status status = session_->ExecuteScript(sql);
    ASSERT_TRUE(status.ok()) << status.message();
  }

  KanbanCard Durable(const std::string& id) {
    auto card_or = store_.GetCard(id);
    EXPECT_TRUE(card_or.ok());
    EXPECT_TRUE(card_or.ok() && card_or->has_value()) << "missing card " << id;
    return card_or.ok() && card_or->has_value() ? **card_or : KanbanCard();
  }

  SqliteRecordStore store_;
  AgentIdentity agent_;
  std::unique_ptr<GuardedSession> session_;
  std::unique_ptr<KanbanSync> sync_;
};

TEST_F(KanbanSyncTest, SeedMirrorsVisibleCards) {
  EXPECT_TRUE(sync_->seeded());
  EXPECT_EQ(sync_->baseline().size(), 3u);
  auto count_or = session_->QueryInt64("SELECT COUNT(*) FROM __kanban_cards");
  ASSERT_TRUE(count_or.ok());
  EXPECT_EQ(*count_or, 3);

  auto stmt_or = session_->Prepare(
      absl::StrCat("SELECT friendly_id FROM __kanban_cards WHERE id = '", kCardA, "'"));
  ASSERT_TRUE(stmt_or.ok());
  auto row_or = (*stmt_or)->Step();
  ASSERT_TRUE(row_or.ok() && *row_or);
  EXPECT_EQ((*stmt_or)->ColumnText(0), "draft-outline");
}

TEST_F(KanbanSyncTest, UntouchedMirrorChangesNothing) {
  KanbanCard before = Durable(kCardA);
  SyncResult result = sync_->Apply();
  EXPECT_EQ(result.domain, "Kanban");
  EXPECT_FALSE(result.changed);
  EXPECT_THAT(result.errors, IsEmpty());
  EXPECT_THAT(result.changes, IsEmpty());
  EXPECT_EQ(Durable(kCardA).updated_at, before.updated_at);

  auto exists_or = session_->TableExists("__kanban_cards");
  ASSERT_TRUE(exists_or.ok());
  EXPECT_FALSE(*exists_or);
}

TEST_F(KanbanSyncTest, CreatesCardWithGeneratedId) {
  Exec("INSERT INTO __kanban_cards (title, description, priority) VALUES ('Write report', 'weekly', 3);");
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.errors, IsEmpty());
  ASSERT_EQ(result.created_ids.size(), 1u);
  EXPECT_TRUE(result.changed);

  KanbanCard created = Durable(result.created_ids[0]);
  EXPECT_EQ(created.title, "Write report");
  EXPECT_EQ(created.friendly_id, "write-report");
  EXPECT_EQ(created.description, "weekly");
  EXPECT_EQ(created.priority, 3);
  EXPECT_EQ(created.status, kCardStatusTodo);
  EXPECT_EQ(created.assigned_agent_id, "agent-1");
  EXPECT_EQ(created.organization_id, "org-1");
  EXPECT_EQ(created.user_id, "user-1");
  EXPECT_FALSE(created.completed_at.has_value());

  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes[0].action, "created");
  EXPECT_EQ(result.changes[0].to, kCardStatusTodo);
}

TEST_F(KanbanSyncTest, RejectsDuplicateTitle) {
  Exec("INSERT INTO __kanban_cards (title) VALUES ('draft OUTLINE');");
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.created_ids, IsEmpty());
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_THAT(result.errors[0], HasSubstr("Kanban duplicate blocked"));
  EXPECT_THAT(result.errors[0], HasSubstr("draft-outline"));

  auto cards_or = store_.ListVisibleCards(agent_);
  ASSERT_TRUE(cards_or.ok());
  EXPECT_EQ(cards_or->size(), 3u);
}

TEST_F(KanbanSyncTest, RejectsCreateWithMalformedId) {
  Exec("INSERT INTO __kanban_cards (id, title) VALUES ('not-a-uuid', 'New work');");
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.created_ids, IsEmpty());
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_THAT(result.errors[0], HasSubstr("create ignored for invalid key: not-a-uuid"));
}

TEST_F(KanbanSyncTest, RejectsCreateForAnotherAgent) {
  Exec("INSERT INTO __kanban_cards (title, assigned_agent_id) VALUES ('Delegated', 'agent-2');");
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.created_ids, IsEmpty());
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_THAT(result.errors[0], HasSubstr("create denied"));
}

TEST_F(KanbanSyncTest, CompletingCardStampsCompletion) {
  Exec(absl::StrCat("UPDATE __kanban_cards SET status = 'done' WHERE id = '", kCardA, "';"));
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.errors, IsEmpty());
  EXPECT_THAT(result.updated_ids, ElementsAre(kCardA));

  KanbanCard card = Durable(kCardA);
  EXPECT_EQ(card.status, kCardStatusDone);
  EXPECT_TRUE(card.completed_at.has_value());
  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes[0].action, "completed");
  EXPECT_EQ(result.changes[0].from, kCardStatusTodo);
  EXPECT_EQ(result.changes[0].to, kCardStatusDone);
}

TEST_F(KanbanSyncTest, ReopeningCardClearsCompletion) {
  Exec(absl::StrCat("UPDATE __kanban_cards SET status = 'doing' WHERE id = '", kCardB, "';"));
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.updated_ids, ElementsAre(kCardB));
  KanbanCard card = Durable(kCardB);
  EXPECT_EQ(card.status, kCardStatusDoing);
  EXPECT_FALSE(card.completed_at.has_value());
  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes[0].action, "started");
}

TEST_F(KanbanSyncTest, OwnerChangeRejectedWhileOtherEditsApply) {
  Exec(absl::StrCat("UPDATE __kanban_cards SET assigned_agent_id = 'agent-2' WHERE id = '", kCardA, "';"));
  Exec(absl::StrCat("UPDATE __kanban_cards SET title = 'Collect more sources' WHERE id = '", kCardB, "';"));
  SyncResult result = sync_->Apply();

  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_THAT(result.errors[0], HasSubstr("owner cannot be changed"));
  EXPECT_THAT(result.updated_ids, ElementsAre(kCardB));

  EXPECT_EQ(Durable(kCardA).assigned_agent_id, "agent-1");
  KanbanCard renamed = Durable(kCardB);
  EXPECT_EQ(renamed.title, "Collect more sources");
  EXPECT_EQ(renamed.friendly_id, "collect-more-sources");
}

TEST_F(KanbanSyncTest, ForeignCardsAreReadOnly) {
  Exec(absl::StrCat("UPDATE __kanban_cards SET title = 'Hijacked' WHERE id = '", kCardOther, "';"));
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.updated_ids, IsEmpty());
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_THAT(result.errors[0], HasSubstr("update denied"));
  EXPECT_EQ(Durable(kCardOther).title, "Someone else's task");
}

TEST_F(KanbanSyncTest, ForeignCardsCannotBeRemoved) {
  Exec(absl::StrCat("DELETE FROM __kanban_cards WHERE id = '", kCardOther, "';"));
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.removed_ids, IsEmpty());
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_THAT(result.errors[0], HasSubstr("removal denied"));
  Durable(kCardOther);
}

TEST_F(KanbanSyncTest, RemovalSplitsArchivedAndDeleted) {
  Exec("DELETE FROM __kanban_cards WHERE assigned_agent_id = 'agent-1';");
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.errors, IsEmpty());
  EXPECT_EQ(result.removed_ids.size(), 2u);
  EXPECT_THAT(result.archived_ids, ElementsAre(kCardB));
  EXPECT_THAT(result.deleted_ids, ElementsAre(kCardA));

  auto card_or = store_.GetCard(kCardA);
  ASSERT_TRUE(card_or.ok());
  EXPECT_FALSE(card_or->has_value());
}

TEST_F(KanbanSyncTest, UnparseableRowIsNotTreatedAsRemoved) {
  Exec(absl::StrCat("UPDATE __kanban_cards SET title = '   ' WHERE id = '", kCardA, "';"));
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.removed_ids, IsEmpty());
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_THAT(result.errors[0], HasSubstr("title is required"));
  EXPECT_EQ(Durable(kCardA).title, "Draft outline");
}

TEST_F(KanbanSyncTest, ApplyWithoutSeedIsEmpty) {
  KanbanSync unseeded(session_.get(), &store_, agent_, KanbanDomain(&store_, agent_));
  SyncResult result = unseeded.Apply();
  EXPECT_FALSE(result.changed);
  EXPECT_THAT(result.errors, IsEmpty());
}

TEST_F(KanbanSyncTest, BoardSnapshotCountsOwnCards) {
  auto board_or = BuildBoardSnapshot(&store_, agent_);
  ASSERT_TRUE(board_or.ok()) << board_or.status().message();
  EXPECT_EQ(board_or->todo_count, 1);
  EXPECT_EQ(board_or->doing_count, 0);
  EXPECT_EQ(board_or->done_count, 1);
  EXPECT_THAT(board_or->todo_titles, ElementsAre("Draft outline"));
  EXPECT_EQ(board_or->ToJson()["done_titles"][0], "Collect sources");
}

}  // namespace
}  // namespace scratchdb
