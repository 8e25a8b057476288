#include "test_utils.hh"

#include <gtest/gtest.h>

using namespace confl;
using namespace confl::test;

namespace {
  Node parse_term(const std::string& source) {
    auto result = parse_source(source);
    EXPECT_TRUE(result.ok) << source;
    if (!result.ok) {
      return {};
    }
    return term_of(result.ast);
  }
}

TEST(Parse, Record) {
  Node record = parse_term("{a = 1, b = \"s\", c = `tag,}");
  ASSERT_TRUE(record);
  ASSERT_EQ(record->type(), Record);
  ASSERT_EQ(record->size(), 3u);
  EXPECT_EQ(text(record->at(0)->front()), "a");
  EXPECT_EQ(record->at(0)->back()->type(), Num);
  EXPECT_EQ(record->at(1)->back()->type(), Str);
  EXPECT_EQ(record->at(2)->back()->type(), Enum);
}

TEST(Parse, List) {
  Node list = parse_term("[1, true, [false]]");
  ASSERT_TRUE(list);
  ASSERT_EQ(list->type(), List);
  ASSERT_EQ(list->size(), 3u);
  EXPECT_EQ(list->at(1)->type(), True);
  EXPECT_EQ(list->at(2)->type(), List);
}

TEST(Parse, LetWithPrecedence) {
  Node let = parse_term("let x = 1 + 2 * 3 in x");
  ASSERT_TRUE(let);
  ASSERT_EQ(let->type(), Let);
  EXPECT_EQ(text(let->at(0)), "x");

  Node sum = let->at(1);
  ASSERT_EQ(sum->type(), Add);
  EXPECT_EQ(sum->front()->type(), Num);
  EXPECT_EQ(sum->back()->type(), Mul);
  EXPECT_EQ(let->at(2)->type(), Var);
}

TEST(Parse, SubtractionIsLeftAssociative) {
  Node sub = parse_term("3 - 2 - 1");
  ASSERT_TRUE(sub);
  ASSERT_EQ(sub->type(), Sub);
  EXPECT_EQ(sub->front()->type(), Sub);
  EXPECT_EQ(text(sub->back()), "1");
}

TEST(Parse, OperatorLevels) {
  Node cmp = parse_term("1 + 1 == 2 * 1");
  ASSERT_TRUE(cmp);
  ASSERT_EQ(cmp->type(), Eq);
  EXPECT_EQ(cmp->front()->type(), Add);
  EXPECT_EQ(cmp->back()->type(), Mul);

  Node lt = parse_term("a < b < c");
  ASSERT_TRUE(lt);
  ASSERT_EQ(lt->type(), LT);
  EXPECT_EQ(lt->front()->type(), LT);
}

TEST(Parse, OperatorWithoutOperand) {
  for (auto source : {"* 2", "1 *", "- 1", "1 <", "== 1", "1 + * 2"}) {
    auto result = parse_source(source);
    EXPECT_FALSE(result.ok) << source;
  }
}

TEST(Parse, CurriedFunction) {
  Node fun = parse_term("fun x y => x");
  ASSERT_TRUE(fun);
  ASSERT_EQ(fun->type(), Fun);
  EXPECT_EQ(text(fun->front()), "x");

  Node inner = fun->back();
  ASSERT_EQ(inner->type(), Fun);
  EXPECT_EQ(text(inner->front()), "y");
  EXPECT_EQ(inner->back()->type(), Var);
}

TEST(Parse, ApplicationBindsTighterThanOperators) {
  Node cmp = parse_term("f x y == g 1");
  ASSERT_TRUE(cmp);
  ASSERT_EQ(cmp->type(), Eq);

  Node app = cmp->front();
  ASSERT_EQ(app->type(), App);
  EXPECT_EQ(app->front()->type(), App);
  EXPECT_EQ(text(app->back()), "y");
  EXPECT_EQ(cmp->back()->type(), App);
}

TEST(Parse, FieldAccess) {
  Node access = parse_term("r.a.b");
  ASSERT_TRUE(access);
  ASSERT_EQ(access->type(), Access);
  EXPECT_EQ(text(access->back()), "b");
  ASSERT_EQ(access->front()->type(), Access);
  EXPECT_EQ(access->front()->front()->type(), Var);
}

TEST(Parse, Conditional) {
  Node cond = parse_term("if 1 < 2 then {a = 1} else [2]");
  ASSERT_TRUE(cond);
  ASSERT_EQ(cond->type(), If);
  EXPECT_EQ(cond->at(0)->type(), LT);
  EXPECT_EQ(cond->at(1)->type(), Record);
  EXPECT_EQ(cond->at(2)->type(), List);
}

TEST(Parse, Import) {
  Node import = parse_term("import \"lib/a.cfl\"");
  ASSERT_TRUE(import);
  ASSERT_EQ(import->type(), Import);
  EXPECT_EQ(unquote(import), "lib/a.cfl");
}

TEST(Parse, EnrichedValues) {
  Node doc = parse_term("doc \"a number\" default 1");
  ASSERT_TRUE(doc);
  ASSERT_EQ(doc->type(), Docstring);
  EXPECT_EQ(unquote(doc->front()), "a number");
  ASSERT_EQ(doc->back()->type(), DefaultValue);
  EXPECT_EQ(doc->back()->front()->type(), Num);
}

TEST(Parse, ContractWithDefault) {
  Node value = parse_term("default (fun x => x) : Num -> (Bool -> #Pos)");
  ASSERT_TRUE(value);
  ASSERT_EQ(value->type(), ContractWithDefault);
  EXPECT_EQ(value->at(1)->type(), Lbl);
  EXPECT_EQ(value->at(2)->type(), Fun);

  Node type = value->at(0);
  ASSERT_EQ(type->type(), Type);
  Node arrow = type->front();
  ASSERT_EQ(arrow->type(), TypeArrow);
  EXPECT_EQ(arrow->front()->type(), TNum);

  Node codomain = arrow->back();
  ASSERT_EQ(codomain->type(), TypeArrow);
  EXPECT_EQ(codomain->front()->type(), TBool);
  ASSERT_EQ(codomain->back()->type(), Flat);
  EXPECT_EQ(text(codomain->back()->front()), "Pos");
}

TEST(Parse, ArrowsAssociateToTheRight) {
  Node value = parse_term("default 1 : Num -> Str -> Dyn");
  ASSERT_TRUE(value);
  Node arrow = value->at(0)->front();
  ASSERT_EQ(arrow->type(), TypeArrow);
  EXPECT_EQ(arrow->front()->type(), TNum);
  EXPECT_EQ(arrow->back()->type(), TypeArrow);
}

TEST(Parse, Comments) {
  Node num = parse_term("// line\n/* block /* nested */ */ 42");
  ASSERT_TRUE(num);
  EXPECT_EQ(text(num), "42");
}

TEST(Parse, Errors) {
  for (auto source : {
         "",
         "{a = 1, a = 2}",
         "{a}",
         "let x = 1",
         "fun => 1",
         "if true then 1",
         "import x",
         "default 1 : Foo",
         "default 1 : Num Bool",
         "default 1 : -> Num",
         "1 +",
         "r.",
         "(1, 2)",
         "1, 2",
         "Num",
         "/* unterminated",
       }) {
    EXPECT_FALSE(parse_source(source).ok) << source;
  }
}
