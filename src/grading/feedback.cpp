#include "grading/feedback.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/regex.hpp>
#include "common/io_utils.hpp"
#include "grading/test_runner.hpp"

namespace grader {
using namespace std;

// 反馈中展示的输出的最大字符数
const size_t MAX_SHOWN_OUTPUT = 200;

static string shorten(const string &text) {
    string normalized = normalize_output(text);
    if (utf8_length(normalized) <= MAX_SHOWN_OUTPUT) return normalized;
    return utf8_truncate(normalized, MAX_SHOWN_OUTPUT) + "...";
}

static string describe_failure(const test_case_result &result) {
    if (result.feedback) return fmt::format("{}: {}", result.name, *result.feedback);
    if (result.error && !result.error->empty() && result.actual_output.empty())
        return fmt::format("{}: {}", result.name, shorten(*result.error));
    if (result.output_pattern)
        return fmt::format("{}: your output \"{}\" does not have the expected format.", result.name, shorten(result.actual_output));
    return fmt::format("{}: expected \"{}\" but your program printed \"{}\".",
                       result.name, shorten(result.expected_output), shorten(result.actual_output));
}

static const error_pattern *match_error_pattern(const test_results &results, const vector<error_pattern> &patterns) {
    for (auto &pattern : patterns) {
        boost::regex regex;
        try {
            regex.assign(pattern.pattern, boost::regex::perl | boost::regex::no_mod_s);
        } catch (const boost::regex_error &ex) {
            LOG(WARNING) << "invalid error pattern '" << pattern.pattern << "': " << ex.what();
            continue;
        }
        for (auto &result : results.results)
            if (!result.passed && result.error && boost::regex_search(*result.error, regex))
                return &pattern;
    }
    return nullptr;
}

string generate_feedback(const test_results &results, const vector<error_pattern> &patterns) {
    if (results.all_passed) return "All tests passed. Great work!";

    vector<string> lines;
    lines.push_back(fmt::format("{} of {} tests passed.", results.passed_tests, results.total_tests));

    int failed_hidden = 0;
    for (auto &result : results.results) {
        if (result.passed) continue;
        if (result.visible)
            lines.push_back(describe_failure(result));
        else
            ++failed_hidden;
    }

    if (failed_hidden > 0)
        lines.push_back(fmt::format("{} hidden test{} failed. Try different edge cases to find the issue.",
                                    failed_hidden, failed_hidden > 1 ? "s" : ""));

    if (auto pattern = match_error_pattern(results, patterns))
        lines.push_back("Hint: " + pattern->feedback);

    return boost::algorithm::join(lines, "\n");
}

}  // namespace grader
