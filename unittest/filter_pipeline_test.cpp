// ============================================================================
// FILTER PIPELINE UNIT TESTS
// ============================================================================
// Tests for metric selection, sorting and pagination
// ============================================================================

#include <gtest/gtest.h>
#include <metricstream/core/storage/filter_pipeline.hpp>
#include <metricstream/core/metrics/metric_factory.hpp>
#include <algorithm>
#include <limits>

using namespace MetricStream;

namespace {

Timestamp at(int64_t seconds) {
    return Clock::from_epoch_ms(1'700'000'000'000 + seconds * 1000);
}

Metric make(const std::string& name, MetricValue value, MetricType type, int64_t second,
            MetricLabels labels = {}, std::optional<std::string> source = std::nullopt,
            std::optional<std::string> correlationId = std::nullopt) {
    std::optional<MetricMetadata> metadata;
    if (source || correlationId) {
        metadata = MetricMetadata{};
        metadata->source = source;
        metadata->correlationId = correlationId;
    }
    return MetricFactory::createMetric(name, std::move(value), type, std::move(labels), metadata, at(second));
}

std::vector<std::string> names(const std::vector<Metric>& metrics) {
    std::vector<std::string> out;
    for (const auto& m : metrics) out.push_back(m.name);
    return out;
}

class FilterPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        metrics = {
            make("requests", MetricFactory::number(10), MetricType::COUNTER, 1,
                 {{"env", "prod"}, {"region", "eu-west"}}, "api", "c-1"),
            make("latency", MetricFactory::numberWithUnit(120, "ms"), MetricType::TIMER, 2,
                 {{"env", "prod"}}, "api", "c-2"),
            make("cpu", MetricFactory::number(55), MetricType::GAUGE, 3,
                 {{"env", "staging"}}, "agent"),
            make("errors", MetricFactory::number(2), MetricType::COUNTER, 4,
                 {{"env", "Staging"}}),
            make("payload", MetricFactory::histogram({{100, 1000}, {4, 1}, 900, 5}), MetricType::HISTOGRAM, 5),
        };
    }

    std::vector<Metric> metrics;
};

} // namespace

// ============================================================================
// SELECTION
// ============================================================================

TEST_F(FilterPipelineTest, EmptyFilterReturnsEverythingInOrder) {
    EXPECT_EQ(names(FilterPipeline::apply(metrics, MetricFilter{})),
              (std::vector<std::string>{"requests", "latency", "cpu", "errors", "payload"}));
}

TEST_F(FilterPipelineTest, TypeFilterKeepsOnlyCounters) {
    MetricFilter filter;
    filter.types = {MetricType::COUNTER};
    auto result = FilterPipeline::apply(metrics, filter);
    ASSERT_EQ(result.size(), 2u);
    for (const auto& m : result) {
        EXPECT_EQ(m.type, MetricType::COUNTER);
    }
}

TEST_F(FilterPipelineTest, NameSetAndPattern) {
    MetricFilter byName;
    byName.names = {"cpu", "missing"};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, byName)), (std::vector<std::string>{"cpu"}));

    MetricFilter byPattern;
    byPattern.namePattern = "^(re|er)";
    EXPECT_EQ(names(FilterPipeline::apply(metrics, byPattern)),
              (std::vector<std::string>{"requests", "errors"}));
}

TEST_F(FilterPipelineTest, InvalidNamePatternIsSkipped) {
    MetricFilter filter;
    filter.namePattern = "([unclosed";
    filter.types = {MetricType::GAUGE};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"cpu"}));
}

TEST_F(FilterPipelineTest, TimeRangeIsInclusive) {
    MetricFilter filter;
    filter.timeRange = TimeRange{at(2), at(4)};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)),
              (std::vector<std::string>{"latency", "cpu", "errors"}));
}

TEST_F(FilterPipelineTest, ExactLabelsAreAnded) {
    MetricFilter filter;
    filter.labels = {{"env", "prod"}, {"region", "eu-west"}};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"requests"}));
}

TEST_F(FilterPipelineTest, LabelFilterOperators) {
    LabelFilter caseless{"env", StringOperator::EQUALS, "staging", {}, false};
    MetricFilter filter;
    filter.labelFilters = {caseless};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"cpu", "errors"}));

    LabelFilter in{"env", StringOperator::IN, "", {"prod", "staging"}, true};
    filter.labelFilters = {in};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)),
              (std::vector<std::string>{"requests", "latency", "cpu"}));

    LabelFilter regex{"region", StringOperator::REGEX, "west$", {}, true};
    filter.labelFilters = {regex};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"requests"}));
}

TEST_F(FilterPipelineTest, MissingLabelMatchesOnlyNegativeOperators) {
    const Metric& payload = metrics.back();
    EXPECT_TRUE(FilterPipeline::matchesLabelFilter(payload, {"env", StringOperator::NOT_EQUALS, "prod", {}, true}));
    EXPECT_TRUE(FilterPipeline::matchesLabelFilter(payload, {"env", StringOperator::NOT_CONTAINS, "p", {}, true}));
    EXPECT_FALSE(FilterPipeline::matchesLabelFilter(payload, {"env", StringOperator::NOT_IN, "", {"prod"}, true}));
    EXPECT_FALSE(FilterPipeline::matchesLabelFilter(payload, {"env", StringOperator::EQUALS, "prod", {}, true}));
}

TEST_F(FilterPipelineTest, InvalidRegexNeverMatches) {
    EXPECT_FALSE(FilterPipeline::matchesLabelFilter(metrics.front(),
                                                    {"env", StringOperator::REGEX, "[", {}, true}));
}

TEST_F(FilterPipelineTest, MetadataFilters) {
    MetricFilter filter;
    filter.metadataFilters = {MetadataFilter{"source", StringOperator::STARTS_WITH, "ag", {}, true}};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"cpu"}));
}

TEST_F(FilterPipelineTest, ValueFiltersUseNumericView) {
    MetricFilter filter;
    filter.valueFilters = {ValueFilter{ValueOperator::GREATER_THAN_OR_EQUAL, 55, std::nullopt, std::nullopt}};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)),
              (std::vector<std::string>{"latency", "cpu", "payload"}));

    filter.valueFilters = {ValueFilter{ValueOperator::BETWEEN, 0, std::make_pair(2.0, 10.0), std::nullopt}};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"requests", "errors"}));

    filter.valueFilters = {ValueFilter{ValueOperator::GREATER_THAN, 0, std::nullopt, std::string("s")}};
    auto result = names(FilterPipeline::apply(metrics, filter));
    EXPECT_EQ(std::count(result.begin(), result.end(), "latency"), 0);
}

TEST_F(FilterPipelineTest, BetweenWithoutRange) {
    ValueFilter between{ValueOperator::BETWEEN, 0, std::nullopt, std::nullopt};
    ValueFilter notBetween{ValueOperator::NOT_BETWEEN, 0, std::nullopt, std::nullopt};
    EXPECT_FALSE(FilterPipeline::matchesValueFilter(metrics.front(), between));
    EXPECT_TRUE(FilterPipeline::matchesValueFilter(metrics.front(), notBetween));
}

TEST_F(FilterPipelineTest, SourceAndCorrelationAllowLists) {
    MetricFilter filter;
    filter.sources = {"api"};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"requests", "latency"}));

    filter.correlationIds = {"c-2"};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"latency"}));
}

// ============================================================================
// SORTING AND PAGINATION
// ============================================================================

TEST_F(FilterPipelineTest, SortByValueDescending) {
    MetricFilter filter;
    filter.sortBy = SortCriteria{SortField::VALUE, SortDirection::DESC, nullptr};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)),
              (std::vector<std::string>{"payload", "latency", "cpu", "requests", "errors"}));
}

TEST_F(FilterPipelineTest, SecondarySortBreaksTies) {
    MetricFilter filter;
    auto secondary = std::make_shared<SortCriteria>(SortCriteria{SortField::NAME, SortDirection::ASC, nullptr});
    filter.sortBy = SortCriteria{SortField::TYPE, SortDirection::ASC, secondary};
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)),
              (std::vector<std::string>{"errors", "requests", "cpu", "payload", "latency"}));
}

TEST_F(FilterPipelineTest, MissingSourceSortsFirst) {
    MetricFilter filter;
    filter.sortBy = SortCriteria{SortField::SOURCE, SortDirection::ASC, nullptr};
    auto result = names(FilterPipeline::apply(metrics, filter));
    EXPECT_EQ(result, (std::vector<std::string>{"errors", "payload", "cpu", "requests", "latency"}));
}

TEST_F(FilterPipelineTest, OffsetAndLimit) {
    MetricFilter filter;
    filter.offset = 1;
    filter.limit = 2;
    EXPECT_EQ(names(FilterPipeline::apply(metrics, filter)), (std::vector<std::string>{"latency", "cpu"}));

    filter.offset = 10;
    EXPECT_TRUE(FilterPipeline::apply(metrics, filter).empty());

    MetricFilter zero;
    zero.limit = 0;
    EXPECT_EQ(FilterPipeline::apply(metrics, zero).size(), metrics.size());

    zero.offset = 3;
    EXPECT_EQ(FilterPipeline::apply(metrics, zero).size(), metrics.size() - 3);
}

TEST_F(FilterPipelineTest, HugeLimitAfterOffsetReturnsRemainder) {
    MetricFilter filter;
    filter.offset = 2;
    filter.limit = std::numeric_limits<size_t>::max();
    auto result = FilterPipeline::apply(metrics, filter);
    ASSERT_EQ(result.size(), metrics.size() - 2);
    EXPECT_EQ(result.front().name, metrics[2].name);
    EXPECT_EQ(result.back().name, metrics.back().name);
}
