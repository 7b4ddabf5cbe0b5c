#include "execution/error_classifier.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <regex>

namespace grader {
using namespace std;

static string line_info(const string &line) {
    return line.empty() ? "" : " on line " + line;
}

static bool contains(const string &text, const char *pattern) {
    return text.find(pattern) != string::npos;
}

static string first_group(const string &text, const regex &pattern) {
    smatch match;
    if (regex_search(text, match, pattern)) return match[1].str();
    return "";
}

classified_error classify_javascript_error(const string &message, const string &stack) {
    static const regex anonymous_frame(R"(<anonymous>:(\d+)(?::(\d+))?)");
    static const regex undefined_name(R"(([\w$]+) is not defined)");
    static const regex not_function(R"(([\w$.]+) is not a function)");
    static const regex blocked(R"(([\w$]+) is not available)");

    string line = first_group(stack, anonymous_frame);

    if (contains(message, "is not defined")) {
        string name = first_group(message, undefined_name);
        if (!name.empty())
            return {fmt::format("Reference Error{}: '{}' is not defined. Did you spell it correctly? Remember to declare variables with let, const, or var.", line_info(line), name)};
    }

    if (contains(message, "is not a function")) {
        string name = first_group(message, not_function);
        if (!name.empty())
            return {fmt::format("Type Error{}: '{}' is not a function. Check that you are calling a function correctly.", line_info(line), name)};
    }

    if (contains(message, "Cannot read properties of undefined") || contains(message, "Cannot read property"))
        return {fmt::format("Type Error{}: Trying to access a property of undefined. Make sure the variable exists and has a value.", line_info(line))};

    if (contains(message, "Cannot read properties of null") || contains(message, "null is not an object"))
        return {fmt::format("Type Error{}: Trying to use null as an object. Check that your variable is not null.", line_info(line))};

    if (contains(message, "Unexpected token"))
        return {fmt::format("Syntax Error{}: Unexpected token in your code. Check for typos, missing brackets, or semicolons.", line_info(line))};

    if (contains(message, "Unexpected end of input"))
        return {fmt::format("Syntax Error{}: Your code seems incomplete. Check for missing closing brackets or quotes.", line_info(line))};

    if (contains(message, "not available in the sandbox")) {
        string name = first_group(message, blocked);
        if (!name.empty())
            return {fmt::format("Security Error: '{}' is not available in the code exercise environment.", name), status::SANDBOX_VIOLATION};
    }

    return {message};
}

classified_error classify_python_error(const string &message, const string &traceback) {
    static const regex exercise_frame(R"re(File "<exercise>", line (\d+))re");
    static const regex any_line(R"(line (\d+))");
    static const regex undefined_name(R"(name '(\w+)' is not defined)");
    static const regex missing_key(R"re(KeyError: ['"]?([^'"\n]+)['"]?)re");
    static const regex blocked(R"(([\w.]+) is not available in the sandbox)");

    string full = traceback.empty() ? message : traceback + "\n" + message;

    // 取最内层的用户代码帧
    string line;
    for (sregex_iterator it(full.begin(), full.end(), exercise_frame), end; it != end; ++it)
        line = (*it)[1].str();
    if (line.empty()) line = first_group(full, any_line);

    if (contains(message, "not available in the sandbox")) {
        string name = first_group(message, blocked);
        if (!name.empty())
            return {fmt::format("Security Error: '{}' is not available in the code exercise environment.", name), status::SANDBOX_VIOLATION};
    }

    if (contains(message, "MemoryError"))
        return {fmt::format("Memory Error{}: Your program used more memory than allowed. Check for very large lists or loops that keep adding data.", line_info(line)), status::MEMORY_LIMIT_EXCEEDED};

    if (contains(message, "IndentationError"))
        return {fmt::format("Indentation Error{}: Python requires consistent indentation. Use 4 spaces for each level of indentation.", line_info(line))};

    if (contains(message, "SyntaxError")) {
        if (contains(message, "unexpected EOF") || contains(message, "was never closed") || contains(message, "incomplete input"))
            return {fmt::format("Syntax Error{}: Your code seems incomplete. Check for missing closing brackets, quotes, or colons.", line_info(line))};
        if (contains(message, "expected ':'") || contains(message, "expected \":\""))
            return {fmt::format("Syntax Error{}: Missing colon (:) after if, for, while, or function definition.", line_info(line))};
        if (contains(message, "invalid syntax"))
            return {fmt::format("Syntax Error{}: Python does not understand this code. Check for typos, missing colons after if/for/while, or mismatched parentheses.", line_info(line))};
    }

    if (contains(message, "NameError")) {
        string name = first_group(message, undefined_name);
        if (!name.empty())
            return {fmt::format("Name Error{}: '{}' is not defined. Did you spell it correctly? Remember to define variables before using them.", line_info(line), name)};
    }

    if (contains(message, "TypeError")) {
        if (contains(message, "can't multiply sequence by non-int"))
            return {fmt::format("Type Error{}: You are trying to multiply a string/list by something that is not a number. Make sure to convert strings to numbers using int() or float().", line_info(line))};
        if (contains(message, "unsupported operand type"))
            return {fmt::format("Type Error{}: You are trying to combine incompatible types (like adding a string to a number). Convert them to the same type first.", line_info(line))};
        if (contains(message, "'NoneType'"))
            return {fmt::format("Type Error{}: You are trying to use None (nothing) as a value. Make sure your function returns something or your variable is set correctly.", line_info(line))};
    }

    if (contains(message, "IndexError"))
        return {fmt::format("Index Error{}: You are trying to access an element that does not exist. Check that your index is within the list/string length.", line_info(line))};

    if (contains(message, "KeyError")) {
        string key = first_group(message, missing_key);
        if (!key.empty())
            return {fmt::format("Key Error{}: The key '{}' does not exist in the dictionary. Check the spelling or use .get() to avoid this error.", line_info(line), key)};
    }

    if (contains(message, "ZeroDivisionError"))
        return {fmt::format("Division Error{}: You cannot divide by zero. Check that your divisor is not zero.", line_info(line))};

    string cleaned = boost::algorithm::replace_all_copy(full, "Traceback (most recent call last):", "Error:");
    boost::algorithm::trim(cleaned);
    return {cleaned};
}

classified_error classify_abnormal_exit(const string &diagnostics, int64_t memory_bytes) {
    if (contains(diagnostics, "heap out of memory") || contains(diagnostics, "Allocation failed") ||
        contains(diagnostics, "MemoryError") || contains(diagnostics, "std::bad_alloc"))
        return {fmt::format("Memory Error: Your program used more memory than the {} MB allowed. Check for very large arrays or loops that keep adding data.",
                            memory_bytes / (1024 * 1024)),
                status::MEMORY_LIMIT_EXCEEDED};

    return {"Runtime Error: Your program stopped unexpectedly before it finished."};
}

}  // namespace grader
