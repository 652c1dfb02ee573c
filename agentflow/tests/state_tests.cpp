#include <gtest/gtest.h>
#include <agentflow/state.hpp>

using namespace agentflow;

TEST(State, DefaultsAfterConstructionFromPrompt) {
  State s("hola");
  EXPECT_EQ(s.user_message, "hola");
  EXPECT_EQ(s.plan_needed, PlanNeeded::unset);
  EXPECT_FALSE(s.execution_complete);
  EXPECT_FALSE(s.final_answer.has_value());
}

TEST(State, MergeOverwritesOnlyNamedFields) {
  State s("simular carga");
  s.final_answer = "before";

  PartialUpdate update;
  update.plan_needed = PlanNeeded::yes;
  merge(s, update);

  EXPECT_EQ(s.user_message, "simular carga");
  EXPECT_EQ(s.plan_needed, PlanNeeded::yes);
  EXPECT_FALSE(s.execution_complete);
  ASSERT_TRUE(s.final_answer.has_value());
  EXPECT_EQ(*s.final_answer, "before");
}

TEST(State, MergeIsLastWriterWins) {
  State s("x");
  PartialUpdate first;
  first.final_answer = "provisional";
  first.execution_complete = true;
  merge(s, first);

  PartialUpdate second;
  second.final_answer = "final";
  merge(s, second);

  EXPECT_EQ(s.final_answer.value_or(""), "final");
  EXPECT_TRUE(s.execution_complete);
}

TEST(State, EmptyUpdateLeavesStateUntouched) {
  State s("x");
  s.plan_needed = PlanNeeded::no;
  const State before = s;
  merge(s, PartialUpdate{});
  EXPECT_EQ(s, before);
}

TEST(PartialUpdate, FieldsReportsEngagedKeys) {
  PartialUpdate update;
  EXPECT_TRUE(update.empty());
  update.execution_complete = false;
  update.final_answer = "";
  auto fields = update.fields();
  EXPECT_TRUE(fields.contains(StateField::execution_complete));
  EXPECT_TRUE(fields.contains(StateField::final_answer));
  EXPECT_FALSE(fields.contains(StateField::plan_needed));
  EXPECT_EQ(fields, StateField::execution_complete | StateField::final_answer);
}

TEST(FieldSet, ContainsSubset) {
  FieldSet writes = StateField::execution_complete | StateField::final_answer;
  EXPECT_TRUE(writes.contains(FieldSet(StateField::final_answer)));
  EXPECT_TRUE(writes.contains(FieldSet{}));
  EXPECT_FALSE(writes.contains(StateField::plan_needed | StateField::final_answer));
  EXPECT_EQ(writes.to_string(), "{execution_complete, final_answer}");
}

TEST(PartialUpdate, DescribeListsFieldsInOrder) {
  PartialUpdate update;
  update.plan_needed = PlanNeeded::no;
  update.final_answer = "done";
  EXPECT_EQ(describe(update), "{plan_needed: no, final_answer: \"done\"}");
  EXPECT_EQ(describe(PartialUpdate{}), "{}");
}

TEST(PlanNeeded, ToString) {
  EXPECT_EQ(to_string(PlanNeeded::yes), "yes");
  EXPECT_EQ(to_string(PlanNeeded::no), "no");
  EXPECT_EQ(to_string(PlanNeeded::unset), "unset");
}
