#include "storyloop/prd/prd_loader.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace storyloop;
using storyloop::test::ids;
using storyloop::test::task_id;

TEST(PrdLoaderTest, LoadFromString_ReadsStoryFields) {
  auto doc = PrdLoader::load_from_string(R"({
    "project": "Checkout",
    "branchName": "feature/checkout",
    "userStories": [
      {"id": "US-001", "title": "Cart model", "priority": 1,
       "fileScope": ["src/cart.cpp", "include/", "src/cart.cpp"]},
      {"id": "US-002", "title": "Payment", "description": "Card payments",
       "dependencies": ["US-001"], "passes": true,
       "estimatedComplexity": "high", "suggestedModel": "opus"}
    ]
  })");

  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->project, "Checkout");
  EXPECT_EQ(doc->branch_name, "feature/checkout");
  ASSERT_EQ(doc->tasks.size(), 2u);

  const auto& cart = doc->tasks[0];
  EXPECT_EQ(cart.id, task_id("US-001"));
  EXPECT_EQ(cart.priority, 1);
  EXPECT_FALSE(cart.passes);
  EXPECT_EQ(cart.file_scope,
            (std::vector<std::string>{"include/", "src/cart.cpp"}));

  const auto& payment = doc->tasks[1];
  EXPECT_EQ(payment.description, "Card payments");
  EXPECT_EQ(payment.dependencies, ids({"US-001"}));
  EXPECT_TRUE(payment.passes);
  EXPECT_EQ(payment.estimated_complexity, "high");
  EXPECT_EQ(payment.suggested_model, "opus");
}

TEST(PrdLoaderTest, LoadFromString_Defaults) {
  auto doc = PrdLoader::load_from_string(R"({"userStories": [{"id": "A"}]})");

  ASSERT_TRUE(doc.has_value());
  ASSERT_EQ(doc->tasks.size(), 1u);
  EXPECT_EQ(doc->tasks[0].priority, kDefaultPriority);
  EXPECT_TRUE(doc->tasks[0].dependencies.empty());
  EXPECT_TRUE(doc->tasks[0].file_scope.empty());
  EXPECT_EQ(doc->tasks[0].estimated_complexity, "medium");
}

TEST(PrdLoaderTest, LoadFromString_Malformed) {
  for (const char* text : {
           "{not json",
           "[]",
           R"({"project": "x"})",
           R"({"userStories": [{"title": "no id"}]})",
           R"({"userStories": [{"id": "A", "dependencies": "B"}]})",
           R"({"userStories": [42]})",
       }) {
    auto doc = PrdLoader::load_from_string(text);
    ASSERT_FALSE(doc.has_value()) << text;
    EXPECT_EQ(doc.error(), make_error_code(Error::ParseError)) << text;
  }
}

TEST(PrdLoaderTest, LoadFromFile_Missing) {
  test::TempDir dir;
  ASSERT_TRUE(dir.valid());

  auto doc = PrdLoader::load_from_file((dir.path() / "prd.json").string());

  EXPECT_FALSE(doc.has_value());
}

TEST(PrdLoaderTest, LoadFromFile) {
  test::TempDir dir;
  ASSERT_TRUE(dir.valid());
  auto path = dir.path() / "prd.json";
  test::write_text(path, R"({"userStories": [{"id": "A"}, {"id": "B",
                            "dependencies": ["A"]}]})");

  auto doc = PrdLoader::load_from_file(path.string());

  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->tasks.size(), 2u);
}
