#include <metricstream/core/storage/filter_pipeline.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>

namespace MetricStream {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Shared by label and metadata filters
bool matchString(const std::optional<std::string>& actual,
                 StringOperator op,
                 const std::string& operand,
                 const std::vector<std::string>& operands,
                 bool caseSensitive) {
    if (!actual) {
        return op == StringOperator::NOT_EQUALS || op == StringOperator::NOT_CONTAINS;
    }

    const std::string subject = caseSensitive ? *actual : toLower(*actual);
    const std::string needle = caseSensitive ? operand : toLower(operand);

    auto inList = [&]() {
        return std::any_of(operands.begin(), operands.end(), [&](const std::string& candidate) {
            return caseSensitive ? candidate == *actual : toLower(candidate) == subject;
        });
    };

    switch (op) {
        case StringOperator::EQUALS:       return subject == needle;
        case StringOperator::NOT_EQUALS:   return subject != needle;
        case StringOperator::CONTAINS:     return subject.find(needle) != std::string::npos;
        case StringOperator::NOT_CONTAINS: return subject.find(needle) == std::string::npos;
        case StringOperator::STARTS_WITH:  return startsWith(subject, needle);
        case StringOperator::ENDS_WITH:    return endsWith(subject, needle);
        case StringOperator::REGEX:
            try {
                auto flags = std::regex::ECMAScript;
                if (!caseSensitive) flags |= std::regex::icase;
                return std::regex_search(*actual, std::regex(operand, flags));
            } catch (const std::regex_error& e) {
                spdlog::debug("[FilterPipeline] Invalid regex '{}': {}", operand, e.what());
                return false;
            }
        case StringOperator::IN:           return inList();
        case StringOperator::NOT_IN:       return !inList();
        default:                           return false;
    }
}

template<typename T>
int threeWay(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

std::string sourceOf(const Metric& m) {
    if (m.metadata && m.metadata->source) return *m.metadata->source;
    return "";
}

int compareChain(const Metric& a, const Metric& b, const SortCriteria& criteria) {
    int result = FilterPipeline::compare(a, b, criteria);
    if (result != 0 || !criteria.secondarySort) {
        return result;
    }
    return compareChain(a, b, *criteria.secondarySort);
}

template<typename Pred>
void keepIf(std::vector<Metric>& metrics, Pred pred) {
    metrics.erase(std::remove_if(metrics.begin(), metrics.end(),
                                 [&](const Metric& m) { return !pred(m); }),
                  metrics.end());
}

} // namespace

bool FilterPipeline::matchesLabelFilter(const Metric& metric, const LabelFilter& filter) {
    std::optional<std::string> actual;
    auto it = metric.labels.find(filter.key);
    if (it != metric.labels.end()) actual = it->second;
    return matchString(actual, filter.op, filter.value, filter.values, filter.caseSensitive);
}

bool FilterPipeline::matchesMetadataFilter(const Metric& metric, const MetadataFilter& filter) {
    std::optional<std::string> actual;
    if (metric.metadata) actual = metric.metadata->field(filter.field);
    return matchString(actual, filter.op, filter.value, filter.values, filter.caseSensitive);
}

bool FilterPipeline::matchesValueFilter(const Metric& metric, const ValueFilter& filter) {
    if (filter.unit) {
        if (const auto* withUnit = std::get_if<NumberWithUnitValue>(&metric.value)) {
            if (withUnit->unit != *filter.unit) return false;
        }
    }

    const double v = numericValue(metric.value);
    switch (filter.op) {
        case ValueOperator::EQUALS:                return v == filter.value;
        case ValueOperator::NOT_EQUALS:            return v != filter.value;
        case ValueOperator::GREATER_THAN:          return v > filter.value;
        case ValueOperator::GREATER_THAN_OR_EQUAL: return v >= filter.value;
        case ValueOperator::LESS_THAN:             return v < filter.value;
        case ValueOperator::LESS_THAN_OR_EQUAL:    return v <= filter.value;
        case ValueOperator::BETWEEN:
            if (!filter.range) return false;
            return v >= filter.range->first && v <= filter.range->second;
        case ValueOperator::NOT_BETWEEN:
            if (!filter.range) return true;
            return v < filter.range->first || v > filter.range->second;
        default:
            return false;
    }
}

int FilterPipeline::compare(const Metric& a, const Metric& b, const SortCriteria& criteria) {
    int result = 0;
    switch (criteria.field) {
        case SortField::NAME:      result = threeWay(a.name, b.name); break;
        case SortField::TIMESTAMP: result = threeWay(a.timestamp, b.timestamp); break;
        case SortField::TYPE:
            result = threeWay(std::string(toString(a.type)), std::string(toString(b.type)));
            break;
        case SortField::VALUE:
            result = threeWay(numericValue(a.value), numericValue(b.value));
            break;
        case SortField::SOURCE:    result = threeWay(sourceOf(a), sourceOf(b)); break;
        default:                   return 0;
    }
    return criteria.direction == SortDirection::ASC ? result : -result;
}

std::vector<Metric> FilterPipeline::apply(std::vector<Metric> metrics, const MetricFilter& filter) {
    if (!filter.names.empty()) {
        keepIf(metrics, [&](const Metric& m) {
            return std::find(filter.names.begin(), filter.names.end(), m.name) != filter.names.end();
        });
    }

    if (filter.namePattern) {
        try {
            std::regex pattern(*filter.namePattern);
            keepIf(metrics, [&](const Metric& m) { return std::regex_search(m.name, pattern); });
        } catch (const std::regex_error& e) {
            // Invalid pattern: skip this stage
            spdlog::debug("[FilterPipeline] Ignoring invalid name pattern '{}': {}",
                          *filter.namePattern, e.what());
        }
    }

    if (!filter.types.empty()) {
        keepIf(metrics, [&](const Metric& m) {
            return std::find(filter.types.begin(), filter.types.end(), m.type) != filter.types.end();
        });
    }

    if (filter.timeRange) {
        const auto& range = *filter.timeRange;
        keepIf(metrics, [&](const Metric& m) {
            return m.timestamp >= range.start && m.timestamp <= range.end;
        });
    }

    if (!filter.labels.empty()) {
        keepIf(metrics, [&](const Metric& m) {
            for (const auto& [key, value] : filter.labels) {
                auto it = m.labels.find(key);
                if (it == m.labels.end() || it->second != value) return false;
            }
            return true;
        });
    }

    if (!filter.labelFilters.empty()) {
        keepIf(metrics, [&](const Metric& m) {
            return std::all_of(filter.labelFilters.begin(), filter.labelFilters.end(),
                               [&](const LabelFilter& f) { return matchesLabelFilter(m, f); });
        });
    }

    if (!filter.metadataFilters.empty()) {
        keepIf(metrics, [&](const Metric& m) {
            return std::all_of(filter.metadataFilters.begin(), filter.metadataFilters.end(),
                               [&](const MetadataFilter& f) { return matchesMetadataFilter(m, f); });
        });
    }

    if (!filter.valueFilters.empty()) {
        keepIf(metrics, [&](const Metric& m) {
            return std::all_of(filter.valueFilters.begin(), filter.valueFilters.end(),
                               [&](const ValueFilter& f) { return matchesValueFilter(m, f); });
        });
    }

    if (!filter.sources.empty()) {
        keepIf(metrics, [&](const Metric& m) {
            return m.metadata && m.metadata->source &&
                   std::find(filter.sources.begin(), filter.sources.end(),
                             *m.metadata->source) != filter.sources.end();
        });
    }

    if (!filter.correlationIds.empty()) {
        keepIf(metrics, [&](const Metric& m) {
            return m.metadata && m.metadata->correlationId &&
                   std::find(filter.correlationIds.begin(), filter.correlationIds.end(),
                             *m.metadata->correlationId) != filter.correlationIds.end();
        });
    }

    if (filter.sortBy) {
        const SortCriteria& criteria = *filter.sortBy;
        std::stable_sort(metrics.begin(), metrics.end(), [&](const Metric& a, const Metric& b) {
            return compareChain(a, b, criteria) < 0;
        });
    }

    // A limit of 0 means no limit
    if (filter.offset || (filter.limit && *filter.limit > 0)) {
        size_t start = std::min(filter.offset.value_or(0), metrics.size());
        size_t end = metrics.size();
        if (filter.limit && *filter.limit > 0) {
            end = start + std::min(*filter.limit, metrics.size() - start);
        }
        metrics = std::vector<Metric>(std::make_move_iterator(metrics.begin() + start),
                                      std::make_move_iterator(metrics.begin() + end));
    }

    return metrics;
}

} // namespace MetricStream
