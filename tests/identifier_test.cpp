#include "core/nodes/Record.hpp"
#include "core/record/Identifier.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

#include "test_nodes.hpp"

using namespace premis;

TEST(Identifier, equality_is_exact_and_case_sensitive) {
  EXPECT_EQ(Identifier("local", "E1"), Identifier("local", "E1"));
  EXPECT_NE(Identifier("local", "E1"), Identifier("local", "e1"));
  EXPECT_NE(Identifier("local", "E1"), Identifier("LOCAL", "E1"));
  EXPECT_NE(Identifier("local", "E1 "), Identifier("local", "E1"));
}

TEST(Identifier, type_and_value_are_not_interchangeable) {
  std::unordered_set<Identifier, IdentifierHash> ids;
  ids.insert(Identifier("a", "b"));
  EXPECT_EQ(ids.count(Identifier("b", "a")), 0u);
  EXPECT_EQ(ids.count(Identifier("a", "b")), 1u);
}

TEST(Identifier, to_string) {
  EXPECT_EQ(Identifier("ark", "ark:/61001/b2xz").toString(), "ark:ark:/61001/b2xz");
}

TEST(IdentifiersOf, rights_yields_one_identifier_per_statement) {
  const auto r = testnodes::rights({Identifier("local", "R1"), Identifier("local", "R2")});
  const IdentifierList expected{Identifier("local", "R1"), Identifier("local", "R2")};
  EXPECT_EQ(identifiersOf(r), expected);
  EXPECT_EQ(identifiersOf(Record(r)), expected);
}

TEST(IdentifiersOf, event_yields_its_single_identifier) {
  const Record rec = testnodes::event("E9");
  EXPECT_EQ(kindOf(rec), RecordKind::Event);
  EXPECT_EQ(identifiersOf(rec), IdentifierList{Identifier("local", "E9")});
}

TEST(IdentifiersOf, object_and_agent_keep_order) {
  const IdentifierList ids{Identifier("local", "X"), Identifier("ark", "Y")};
  EXPECT_EQ(identifiersOf(Record(testnodes::object(ids))), ids);
  EXPECT_EQ(identifiersOf(Record(testnodes::agent(ids))), ids);
}

TEST(KindName, names_every_kind) {
  EXPECT_STREQ(kindName(RecordKind::Object), "object");
  EXPECT_STREQ(kindName(RecordKind::Event), "event");
  EXPECT_STREQ(kindName(RecordKind::Agent), "agent");
  EXPECT_STREQ(kindName(RecordKind::Rights), "rights");
}

TEST(KindOf, matches_the_held_alternative) {
  EXPECT_EQ(kindOf(Record(testnodes::object({Identifier("local", "O")}))), RecordKind::Object);
  EXPECT_EQ(kindOf(Record(testnodes::event("E"))), RecordKind::Event);
  EXPECT_EQ(kindOf(Record(testnodes::agent({Identifier("local", "A")}))), RecordKind::Agent);
  EXPECT_EQ(kindOf(Record(testnodes::rights({Identifier("local", "R")}))), RecordKind::Rights);
}
