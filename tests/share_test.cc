#include "test_utils.hh"
#include "transform.hh"

#include <gtest/gtest.h>
#include <map>

using namespace confl;
using namespace confl::test;

namespace {
  Node num(const std::string& n) {
    return Num ^ n;
  }

  Node add(Node lhs, Node rhs) {
    return Add << lhs << rhs;
  }

  Node field(const std::string& name, Node value) {
    return Field << (Ident ^ name) << value;
  }
}

TEST(ShouldShare, AtomsAreNotShared) {
  EXPECT_FALSE(should_share(NodeDef::create(True)));
  EXPECT_FALSE(should_share(NodeDef::create(False)));
  EXPECT_FALSE(should_share(num("1")));
  EXPECT_FALSE(should_share(Str ^ "\"s\""));
  EXPECT_FALSE(should_share(Lbl ^ ":"));
  EXPECT_FALSE(should_share(Sym ^ "sym"));
  EXPECT_FALSE(should_share(Var ^ "x"));
  EXPECT_FALSE(should_share(Enum ^ "`tag"));
  EXPECT_FALSE(should_share(Fun << (Ident ^ "x") << (Var ^ "x")));
}

TEST(ShouldShare, CompoundTermsAreShared) {
  EXPECT_TRUE(should_share(Record << field("a", num("1"))));
  EXPECT_TRUE(should_share(List << num("1")));
  EXPECT_TRUE(should_share(Let << (Ident ^ "x") << num("1") << (Var ^ "x")));
  EXPECT_TRUE(should_share(App << (Var ^ "f") << num("1")));
  EXPECT_TRUE(should_share(add(num("1"), num("1"))));
  EXPECT_TRUE(should_share(DefaultValue << num("1")));
  EXPECT_TRUE(should_share(
    ContractWithDefault << (Type << TNum) << (Lbl ^ ":") << num("1")));
  EXPECT_TRUE(should_share(Docstring << (Doc ^ "\"d\"") << num("1")));
  EXPECT_TRUE(should_share(Import ^ "\"a\""));
}

TEST(ShareOne, RecordFieldIsBound) {
  Node sum = add(num("1"), num("1"));
  Node result = share_one(Record << field("a", sum));

  ASSERT_EQ(result->type(), Let);
  ASSERT_EQ(result->size(), 3u);
  auto name = text(result->at(0));
  EXPECT_TRUE(is_fresh_var(name));
  EXPECT_EQ(result->at(1), sum);

  Node record = result->at(2);
  ASSERT_EQ(record->type(), Record);
  ASSERT_EQ(record->size(), 1u);
  Node value = record->front()->back();
  EXPECT_EQ(value->type(), Var);
  EXPECT_EQ(text(value), name);
  EXPECT_EQ(text(record->front()->front()), "a");
}

TEST(ShareOne, ListElementsAreBound) {
  Node first = add(num("1"), num("1"));
  Node second = add(num("2"), num("2"));
  Node result = share_one(List << first << second);

  std::map<std::string, Node> bindings;
  while (result->type() == Let) {
    bindings[text(result->at(0))] = result->at(1);
    result = result->at(2);
  }
  ASSERT_EQ(bindings.size(), 2u);

  ASSERT_EQ(result->type(), List);
  ASSERT_EQ(result->size(), 2u);
  ASSERT_EQ(result->at(0)->type(), Var);
  ASSERT_EQ(result->at(1)->type(), Var);
  EXPECT_EQ(bindings.at(text(result->at(0))), first);
  EXPECT_EQ(bindings.at(text(result->at(1))), second);
}

TEST(ShareOne, OnlyShareableElementsAreBound) {
  Node result = share_one(List << num("1") << (List << num("2")) << (Var ^ "x"));

  ASSERT_EQ(result->type(), Let);
  Node list = result->at(2);
  ASSERT_EQ(list->type(), List);
  EXPECT_EQ(list->at(0)->type(), Num);
  EXPECT_EQ(list->at(1)->type(), Var);
  EXPECT_EQ(text(list->at(2)), "x");
}

TEST(ShareOne, SharedTermsAreLeftAlone) {
  Node record = Record << field("a", Var ^ "%0") << field("b", num("1"));
  auto before = print(record);
  EXPECT_EQ(share_one(record), record);
  EXPECT_EQ(print(record), before);

  Node list = List << (Var ^ "%1") << (Str ^ "\"s\"");
  EXPECT_EQ(share_one(list), list);
}

TEST(ShareOne, SharingIsIdempotent) {
  Node once = share_one(Record << field("a", add(num("1"), num("1"))));
  ASSERT_EQ(once->type(), Let);
  Node record = once->at(2);
  auto before = print(record);
  EXPECT_EQ(share_one(record), record);
  EXPECT_EQ(print(record), before);
}

TEST(ShareOne, WrapperGetsOneBinding) {
  Node inner = List << num("1");
  Node result = share_one(
    ContractWithDefault << (Type << TList) << (Lbl ^ ":") << inner);

  ASSERT_EQ(result->type(), Let);
  EXPECT_EQ(result->at(1), inner);

  Node wrapper = result->at(2);
  ASSERT_EQ(wrapper->type(), ContractWithDefault);
  EXPECT_EQ(wrapper->at(0)->type(), Type);
  EXPECT_EQ(wrapper->at(1)->type(), Lbl);
  EXPECT_EQ(text(wrapper->at(2)), text(result->at(0)));
}

TEST(ShareOne, DefaultValueGetsOneBinding) {
  Node inner = List << num("1") << add(num("1"), num("2"));
  Node result = share_one(DefaultValue << inner);

  ASSERT_EQ(result->type(), Let);
  EXPECT_EQ(result->at(1), inner);
  EXPECT_EQ(count(result, Let), 1u);

  Node wrapper = result->at(2);
  ASSERT_EQ(wrapper->type(), DefaultValue);
  ASSERT_EQ(wrapper->size(), 1u);
  EXPECT_EQ(wrapper->front()->type(), Var);
  EXPECT_EQ(text(wrapper->front()), text(result->at(0)));
}

TEST(ShareOne, DocstringKeepsItsText) {
  Node inner = Record << field("a", num("1"));
  Node result = share_one(Docstring << (Doc ^ "\"about a\"") << inner);

  ASSERT_EQ(result->type(), Let);
  EXPECT_EQ(result->at(1), inner);
  EXPECT_EQ(count(result, Let), 1u);

  Node wrapper = result->at(2);
  ASSERT_EQ(wrapper->type(), Docstring);
  ASSERT_EQ(wrapper->size(), 2u);
  ASSERT_EQ(wrapper->front()->type(), Doc);
  EXPECT_EQ(unquote(wrapper->front()), "about a");
  EXPECT_EQ(text(wrapper->back()), text(result->at(0)));
}

TEST(ShareOne, WrapperOfAtomIsUnchanged) {
  Node wrapped = DefaultValue << num("1");
  EXPECT_EQ(share_one(wrapped), wrapped);

  Node doc = Docstring << (Doc ^ "\"d\"") << (Var ^ "x");
  EXPECT_EQ(share_one(doc), doc);
}

TEST(ShareOne, OtherTermsAreUnchanged) {
  Node app = App << (Var ^ "f") << (List << num("1"));
  EXPECT_EQ(share_one(app), app);
  EXPECT_EQ(app->back()->type(), List);
}
