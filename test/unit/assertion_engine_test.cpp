// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "assertion_engine.hpp"

#include "utils/recording_reporter.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace conformance {
namespace {

using test::RecordingReporter;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;

/**
 * @brief Mock schema for driving the assertion engine with canned outcomes.
 */
class MockSchema : public ISchema {
public:
    MOCK_METHOD(ValidationResult, validate, (const rapidjson::Value& input), (const, override));
};

Rejected type_rejection() {
    return Rejected{{"type"}, {"x"}, {"properties", "x"}};
}

class AssertionEngineTest : public ::testing::Test {
protected:
    RecordingReporter reporter_;
    AssertionEngine engine_{reporter_};
    MockSchema schema_;
    rapidjson::Value input_{42};
    CheckContext context_{"point", "objects/bad-point", std::nullopt};
};

//
// Path rendering
//

TEST(FormatPathTest, RootAndNested) {
    EXPECT_EQ(format_path({}), "(empty)");
    EXPECT_EQ(format_path({"properties", "x"}), "[ properties x ]");
}

TEST(FormatPathTest, DescribeRejection) {
    EXPECT_EQ(describe(type_rejection()),
              "rejected (type) at value [ x ] by check [ properties x ]");
}

//
// assert_pass
//

TEST_F(AssertionEngineTest, PassAccepted) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{Accepted{}}));

    engine_.assert_pass(schema_, input_, context_);

    ASSERT_EQ(reporter_.points().size(), 1u);
    const auto& recorded = reporter_.points()[0];
    EXPECT_TRUE(recorded.point.ok);
    EXPECT_EQ(recorded.point.description, "VALID  : objects/bad-point against point");
    EXPECT_TRUE(recorded.diags.empty());
}

TEST_F(AssertionEngineTest, PassRejectedExplainsWhy) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{type_rejection()}));

    engine_.assert_pass(schema_, input_, context_);

    ASSERT_EQ(reporter_.points().size(), 1u);
    const auto& recorded = reporter_.points()[0];
    EXPECT_FALSE(recorded.point.ok);
    EXPECT_THAT(recorded.diags, ElementsAre(HasSubstr("rejected (type)")));
    EXPECT_EQ(reporter_.summary().failed, 1);
}

TEST_F(AssertionEngineTest, KnownFailureReasonIsAttached) {
    context_.todo = "typed as double";
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{type_rejection()}));

    engine_.assert_pass(schema_, input_, context_);

    ASSERT_EQ(reporter_.points().size(), 1u);
    EXPECT_EQ(reporter_.points()[0].point.todo, std::optional<std::string>("typed as double"));
    EXPECT_TRUE(reporter_.summary().success());
}

//
// assert_fail
//

TEST_F(AssertionEngineTest, FailAcceptedRecordsSinglePoint) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{Accepted{}}));

    engine_.assert_fail(schema_, input_, context_, ExpectedDetail{PathSegments{"x"}, {}, {}});

    ASSERT_EQ(reporter_.points().size(), 1u);
    EXPECT_FALSE(reporter_.points()[0].point.ok);
    EXPECT_EQ(reporter_.points()[0].point.description,
              "INVALID: objects/bad-point against point");
}

TEST_F(AssertionEngineTest, FailRejectedWithoutDetail) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{type_rejection()}));

    engine_.assert_fail(schema_, input_, context_, std::nullopt);

    EXPECT_THAT(reporter_.descriptions(),
                ElementsAre("INVALID: objects/bad-point against point",
                            "...rejection is structured"));
    EXPECT_TRUE(reporter_.summary().success());
}

TEST_F(AssertionEngineTest, FailRejectedUnstructured) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{Rejected{}}));

    engine_.assert_fail(schema_, input_, context_, std::nullopt);

    ASSERT_EQ(reporter_.points().size(), 2u);
    EXPECT_TRUE(reporter_.points()[0].point.ok);
    EXPECT_FALSE(reporter_.points()[1].point.ok);
}

TEST_F(AssertionEngineTest, FailDetailAllMatch) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{type_rejection()}));

    ExpectedDetail expected{PathSegments{"x"}, PathSegments{"properties", "x"},
                            std::vector<std::string>{"type"}};
    engine_.assert_fail(schema_, input_, context_, expected);

    EXPECT_THAT(reporter_.descriptions(),
                ElementsAre("INVALID: objects/bad-point against point",
                            "...rejection is structured", "...value: [ x ]",
                            "...check: [ properties x ]", "...failure type(s): type"));
    EXPECT_EQ(reporter_.summary().passed, 5);
}

TEST_F(AssertionEngineTest, FailDetailMismatchesAreIndependent) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{type_rejection()}));

    // Wrong value path, right check path, wrong failure type
    ExpectedDetail expected{PathSegments{}, PathSegments{"properties", "x"},
                            std::vector<std::string>{"minimum"}};
    engine_.assert_fail(schema_, input_, context_, expected);

    const auto& points = reporter_.points();
    ASSERT_EQ(points.size(), 5u);

    EXPECT_EQ(points[2].point.description, "...value: (empty)");
    EXPECT_FALSE(points[2].point.ok);
    EXPECT_THAT(points[2].diags, ElementsAre("expected (empty), got [ x ]"));

    EXPECT_TRUE(points[3].point.ok);
    EXPECT_TRUE(points[3].diags.empty());

    EXPECT_FALSE(points[4].point.ok);
    EXPECT_THAT(points[4].diags, ElementsAre("expected failure types [minimum], got [type]"));

    EXPECT_EQ(reporter_.summary().failed, 2);
}

TEST_F(AssertionEngineTest, FailDetailRootPathMatches) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{Rejected{{"type"}, {}, {}}}));

    engine_.assert_fail(schema_, input_, context_,
                        ExpectedDetail{PathSegments{}, PathSegments{}, std::nullopt});

    EXPECT_THAT(reporter_.descriptions(),
                ElementsAre("INVALID: objects/bad-point against point",
                            "...rejection is structured", "...value: (empty)",
                            "...check: (empty)"));
    EXPECT_TRUE(reporter_.summary().success());
}

TEST_F(AssertionEngineTest, FailureTypesCompareAsSets) {
    EXPECT_CALL(schema_, validate(_))
        .WillOnce(Return(ValidationResult{Rejected{{"type", "minimum"}, {}, {}}}));

    ExpectedDetail expected{std::nullopt, std::nullopt,
                            std::vector<std::string>{"minimum", "type"}};
    engine_.assert_fail(schema_, input_, context_, expected);

    ASSERT_EQ(reporter_.points().size(), 3u);
    EXPECT_EQ(reporter_.points()[2].point.description, "...failure type(s): minimum type");
    EXPECT_TRUE(reporter_.points()[2].point.ok);
}

TEST_F(AssertionEngineTest, OnlyPresentDetailFieldsAreChecked) {
    EXPECT_CALL(schema_, validate(_)).WillOnce(Return(ValidationResult{type_rejection()}));

    engine_.assert_fail(schema_, input_, context_,
                        ExpectedDetail{std::nullopt, PathSegments{"properties", "x"}, std::nullopt});

    EXPECT_THAT(reporter_.descriptions(),
                ElementsAre("INVALID: objects/bad-point against point",
                            "...rejection is structured", "...check: [ properties x ]"));
}

} // namespace
} // namespace conformance
