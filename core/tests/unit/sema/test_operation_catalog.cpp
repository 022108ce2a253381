// tests/unit/sema/test_operation_catalog.cpp - Built-in operation signatures
//

#include <gtest/gtest.h>

#include <algorithm>

#include "eligian/sema/operation_catalog.hpp"

using namespace eligian;

TEST(OperationCatalogTest, FindsBuiltins)
{
  const auto & ops = OperationCatalog::builtin();

  const OperationSignature * sig = ops.find("selectElement");
  ASSERT_NE(sig, nullptr);
  EXPECT_EQ(sig->required_count(), 1u);
  EXPECT_EQ(sig->total_count(), 2u);
  ASSERT_NE(sig->param_at(0), nullptr);
  EXPECT_EQ(sig->param_at(0)->type, ParamType::Selector);
  EXPECT_EQ(sig->param_at(2), nullptr);

  EXPECT_TRUE(ops.contains("addClass"));
  EXPECT_FALSE(ops.contains("fadeIn"));
}

TEST(OperationCatalogTest, ParameterTypesDriveChecks)
{
  const auto & ops = OperationCatalog::builtin();

  EXPECT_EQ(ops.find("addClass")->param_at(0)->type, ParamType::ClassName);
  EXPECT_EQ(ops.find("reparentElement")->param_at(0)->type, ParamType::Selector);
  const OperationParam * label = ops.find("addControllerToElement")->find_param("labelId");
  ASSERT_NE(label, nullptr);
  EXPECT_EQ(label->type, ParamType::LabelId);
  EXPECT_FALSE(label->required);
}

TEST(OperationCatalogTest, FormatUsageBracketsOptionalParameters)
{
  const auto & ops = OperationCatalog::builtin();

  EXPECT_EQ(ops.find("addClass")->format_usage(), "addClass(className)");
  EXPECT_EQ(
    ops.find("animate")->format_usage(),
    "animate(animationProperties, animationDuration, [animationEasing])");
  EXPECT_EQ(ops.find("clearElement")->format_usage(), "clearElement()");
}

TEST(OperationCatalogTest, NamesAreSortedAndSuggestionsClose)
{
  const auto & ops = OperationCatalog::builtin();

  const auto names = ops.names();
  EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
  EXPECT_NE(std::find(names.begin(), names.end(), "broadcastEvent"), names.end());

  const auto suggestions = ops.suggest("adClass", 3);
  ASSERT_FALSE(suggestions.empty());
  EXPECT_EQ(suggestions.front(), "addClass");
}
