#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "recall_core/db/record_filter.hpp"

namespace recall_core {

TEST(RecordFilterTest, AllRendersTautology) {
  std::vector<std::string> params;
  EXPECT_EQ(RecordFilter::all().to_sql(params), "1 = 1");
  EXPECT_TRUE(params.empty());
}

TEST(RecordFilterTest, EqualityBindsValueInsteadOfInliningIt) {
  std::vector<std::string> params;
  std::string sql = RecordFilter::owner_is("bob'; DROP TABLE x; --").to_sql(params);

  EXPECT_EQ(sql, "user_id = ?");
  ASSERT_EQ(params.size(), 1u);
  EXPECT_EQ(params[0], "bob'; DROP TABLE x; --");
}

TEST(RecordFilterTest, CompositionKeepsPlaceholderOrder) {
  std::vector<std::string> params;
  auto filter = (RecordFilter::source_is("doc.pdf") && RecordFilter::owner_is("u1")) ||
                RecordFilter::visibility_is(Visibility::Shared);

  EXPECT_EQ(filter.to_sql(params), "((source = ? AND user_id = ?) OR visibility = ?)");
  EXPECT_EQ(params, (std::vector<std::string>{"doc.pdf", "u1", "shared"}));
}

TEST(RecordFilterTest, ReferencesFindsNestedFields) {
  auto filter = RecordFilter::owner_is("u1") || RecordFilter::visibility_is(Visibility::Shared);

  EXPECT_TRUE(filter.references(RecordField::Owner));
  EXPECT_TRUE(filter.references(RecordField::Visibility));
  EXPECT_FALSE(filter.references(RecordField::Source));
  EXPECT_FALSE(RecordFilter::all().references(RecordField::Owner));
}

TEST(RecordFilterTest, MatchesEvaluatesVisibilityRule) {
  auto visible_to_b = RecordFilter::owner_is("b") || RecordFilter::visibility_is(Visibility::Shared);

  auto own_private =
      recall_tests::TestUtilities::create_test_fragment("b", "s", Visibility::Private, "t");
  auto foreign_private =
      recall_tests::TestUtilities::create_test_fragment("a", "s", Visibility::Private, "t");
  auto foreign_shared =
      recall_tests::TestUtilities::create_test_fragment("a", "s", Visibility::Shared, "t");

  EXPECT_TRUE(visible_to_b.matches(own_private));
  EXPECT_FALSE(visible_to_b.matches(foreign_private));
  EXPECT_TRUE(visible_to_b.matches(foreign_shared));
}

TEST(RecordFilterTest, MatchesIdAndSource) {
  auto fragment =
      recall_tests::TestUtilities::create_test_fragment("a", "doc.pdf", Visibility::Private, "t");
  fragment.id = "fixed-id";

  EXPECT_TRUE((RecordFilter::id_is("fixed-id") && RecordFilter::source_is("doc.pdf")).matches(fragment));
  EXPECT_FALSE((RecordFilter::id_is("fixed-id") && RecordFilter::source_is("other")).matches(fragment));
  EXPECT_TRUE(RecordFilter::all().matches(fragment));
}

}  // namespace recall_core
