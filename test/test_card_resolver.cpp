#include "CardResolver.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace testing_support;

class CardResolverTest : public ::testing::Test {
 protected:
  static constexpr const char* kBase = "https://api.test";

  TempDir dir_;
  ManualClock clock_;
  FakeTransport transport_;
  Endpoints endpoints_{kBase};
  std::shared_ptr<SqliteDB> db_;
  std::unique_ptr<CardStore> store_;
  std::unique_ptr<ResponseCache> responses_;
  std::unique_ptr<CardResolver> resolver_;

  void SetUp() override {
    db_ = std::make_shared<SqliteDB>(dir_.Path() / "resolver.sqlite3");
    store_ = std::make_unique<CardStore>(db_);
    responses_ = std::make_unique<ResponseCache>(*store_, clock_.AsClock());
    resolver_ = std::make_unique<CardResolver>(
      *store_, *responses_, transport_, endpoints_, Config::kOneDay);
  }

  void Seed(const std::string& id, const std::string& name,
            std::optional<std::int64_t> mtgo = std::nullopt) {
    store_->InsertCard(*CardRecord::FromDocument(CardDoc(id, name, mtgo)));
  }

  std::string IdUrl(const std::string& id) const {
    return endpoints_.CardById(id).ToString();
  }
  std::string NameUrl(const std::string& name) const {
    return endpoints_.CardByName(name).ToString();
  }
  std::string MtgoUrl(std::int64_t n) const {
    return endpoints_.CardByForeignId(n).ToString();
  }
};

TEST_F(CardResolverTest, QueryNeedsExactlyOneKey) {
  SCOPED_TRACE("No key, or several keys, is a programming error.");
  RecordProperty("description",
                 "Resolve throws InvalidQuery for an empty query and for a "
                 "query with two keys, without touching the network.");

  EXPECT_THROW(resolver_->Resolve(CardQuery{}), InvalidQuery);

  CardQuery both = CardQuery::ById("abc-1");
  both.name = "Foo";
  EXPECT_THROW(resolver_->Resolve(both), InvalidQuery);

  EXPECT_EQ(transport_.TotalCalls(), 0);
}

TEST_F(CardResolverTest, IdHitNeverGoesRemote) {
  SCOPED_TRACE("A stored id is final, whatever its age.");
  RecordProperty("description",
                 "A direct id hit returns the stored payload with zero "
                 "requests, even long after any TTL.");

  Seed("abc-1", "Foo");
  clock_.Advance(std::chrono::hours(24 * 365));

  auto doc = resolver_->Resolve(CardQuery::ById("abc-1"));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(*doc, CardDoc("abc-1", "Foo"));
  EXPECT_EQ(transport_.TotalCalls(), 0);
}

TEST_F(CardResolverTest, IdMissWritesBackExactlyOnce) {
  SCOPED_TRACE("A remote id lookup becomes a permanent card record.");
  RecordProperty("description",
                 "After a successful remote fetch of X there is exactly one "
                 "record with id X.");

  transport_.RespondJson(IdUrl("X"), CardDoc("X", "Ex"));

  ASSERT_TRUE(resolver_->Resolve(CardQuery::ById("X")).has_value());

  ASSERT_TRUE(store_->GetById("X").has_value());
  EXPECT_EQ(store_->CountCards(), 1);
  EXPECT_EQ(transport_.Calls(IdUrl("X")), 1);
}

TEST_F(CardResolverTest, IdResolutionIsIdempotent) {
  SCOPED_TRACE("Two resolutions of one id, one request, same bytes.");
  RecordProperty("description",
                 "The second call is answered from the store and returns a "
                 "byte-identical payload.");

  auto remote = CardDoc("abc-1", "Foo");
  remote["oracle_text"] = "Draw a card.";
  transport_.RespondJson(IdUrl("abc-1"), remote);

  auto first = resolver_->Resolve(CardQuery::ById("abc-1"));
  auto second = resolver_->Resolve(CardQuery::ById("abc-1"));

  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->dump(), second->dump());
  EXPECT_EQ(transport_.TotalCalls(), 1);
}

TEST_F(CardResolverTest, WriteBackOutlivesResponseTtl) {
  SCOPED_TRACE("The card record is permanent, unlike the URL entry.");
  RecordProperty("description",
                 "With the upstream disabled and the TTL long expired, the "
                 "id still resolves from the store.");

  transport_.RespondJson(IdUrl("abc-1"), CardDoc("abc-1", "Foo"));
  auto first = resolver_->Resolve(CardQuery::ById("abc-1"));

  transport_.Unreachable(IdUrl("abc-1"));
  clock_.Advance(std::chrono::hours(24 * 30));

  auto second = resolver_->Resolve(CardQuery::ById("abc-1"));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, *first);
  EXPECT_EQ(transport_.Calls(IdUrl("abc-1")), 1);
}

TEST_F(CardResolverTest, IdUnknownEverywhere) {
  SCOPED_TRACE("Remote 404 for an unknown id.");
  RecordProperty("description",
                 "Nothing is returned and nothing is stored.");

  transport_.Respond(IdUrl("ghost"), 404, R"({"object":"error"})");

  EXPECT_FALSE(resolver_->Resolve(CardQuery::ById("ghost")).has_value());
  EXPECT_EQ(store_->CountCards(), 0);
}

TEST_F(CardResolverTest, NameSingleLocalMatch) {
  SCOPED_TRACE("Exactly one local match is trusted.");
  RecordProperty("description",
                 "by_name with one stored match returns it without a "
                 "request.");

  Seed("foo-1", "Foo");

  auto doc = resolver_->Resolve(CardQuery::ByName("Foo"));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ((*doc)["id"].get<std::string>(), "foo-1");
  EXPECT_EQ(transport_.TotalCalls(), 0);
}

TEST_F(CardResolverTest, NameZeroLocalWritesBack) {
  SCOPED_TRACE("Unknown name: ask upstream and remember the answer.");
  RecordProperty("description",
                 "With no local Bar, the exact-name result is returned and "
                 "stored as exactly one record bar-1.");

  transport_.RespondJson(NameUrl("Bar"), CardDoc("bar-1", "Bar"));

  auto doc = resolver_->Resolve(CardQuery::ByName("Bar"));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(*doc, CardDoc("bar-1", "Bar"));

  EXPECT_EQ(store_->CountCards(), 1);
  EXPECT_TRUE(store_->GetById("bar-1").has_value());

  // now a single local match: no further requests
  resolver_->Resolve(CardQuery::ByName("Bar"));
  EXPECT_EQ(transport_.Calls(NameUrl("Bar")), 1);
}

TEST_F(CardResolverTest, AmbiguousNameDefersWithoutInsert) {
  SCOPED_TRACE("Two local Bars: the upstream decides, the store is frozen.");
  RecordProperty("description",
                 "by_name with two local matches always requests the exact-"
                 "name endpoint and never adds a third record.");

  Seed("bar-1", "Bar");
  Seed("bar-2", "Bar");
  transport_.RespondJson(NameUrl("Bar"), CardDoc("bar-3", "Bar"));

  auto doc = resolver_->Resolve(CardQuery::ByName("Bar"));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ((*doc)["id"].get<std::string>(), "bar-3");
  EXPECT_EQ(transport_.Calls(NameUrl("Bar")), 1);
  EXPECT_EQ(store_->FindByName("Bar").size(), 2u);
  EXPECT_FALSE(store_->GetById("bar-3").has_value());
}

TEST_F(CardResolverTest, AmbiguousNameUpstreamDown) {
  SCOPED_TRACE("Ambiguity plus no upstream means no answer.");
  RecordProperty("description",
                 "With two local matches and an unreachable upstream, "
                 "Resolve returns nullopt rather than guessing.");

  Seed("bar-1", "Bar");
  Seed("bar-2", "Bar");

  EXPECT_FALSE(resolver_->Resolve(CardQuery::ByName("Bar")).has_value());
  EXPECT_EQ(transport_.Calls(NameUrl("Bar")), 1);
  EXPECT_EQ(store_->CountCards(), 2);
}

TEST_F(CardResolverTest, ForeignIdFollowsNamePolicy) {
  SCOPED_TRACE("MTGO ids get the same tie-break as names.");
  RecordProperty("description",
                 "One local match is served locally, zero writes back, two "
                 "defer upstream without inserting.");

  Seed("one", "One", 1);
  auto single = resolver_->Resolve(CardQuery::ByForeignId(1));
  ASSERT_TRUE(single.has_value());
  EXPECT_EQ((*single)["id"].get<std::string>(), "one");
  EXPECT_EQ(transport_.TotalCalls(), 0);

  transport_.RespondJson(MtgoUrl(12345), CardDoc("6875ce99", "Fresh", 12345));
  ASSERT_TRUE(resolver_->Resolve(CardQuery::ByForeignId(12345)).has_value());
  EXPECT_EQ(store_->FindByForeignId(12345).size(), 1u);

  Seed("swamp-a", "Swamp", 31156);
  Seed("swamp-b", "Swamp", 31156);
  transport_.RespondJson(MtgoUrl(31156), CardDoc("swamp-c", "Swamp", 31156));
  auto doc = resolver_->Resolve(CardQuery::ByForeignId(31156));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ((*doc)["name"].get<std::string>(), "Swamp");
  EXPECT_EQ(store_->FindByForeignId(31156).size(), 2u);
}

TEST_F(CardResolverTest, NameWriteBackDoesNotDuplicateKnownId) {
  SCOPED_TRACE("The upstream may answer with a card stored under another name.");
  RecordProperty("description",
                 "A zero-match name whose remote result has an id already "
                 "present leaves that record untouched.");

  Seed("lotus", "Black Lotus");
  transport_.RespondJson(NameUrl("black lotus"), CardDoc("lotus", "Black Lotus"));

  auto doc = resolver_->Resolve(CardQuery::ByName("black lotus"));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(store_->CountCards(), 1);
}

TEST_F(CardResolverTest, NonCardResponseIsNotFound) {
  SCOPED_TRACE("A 2xx that is not a card document is treated as a miss.");
  RecordProperty("description",
                 "Documents without id/name are neither returned nor stored.");

  transport_.RespondJson(IdUrl("odd"), nlohmann::json{{"object", "list"}});

  EXPECT_FALSE(resolver_->Resolve(CardQuery::ById("odd")).has_value());
  EXPECT_EQ(store_->CountCards(), 0);
}
