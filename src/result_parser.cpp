#include "result_parser.h"
#include "errors.h"
#include "constants.h"

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <vector>

namespace gradebox {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string xml_unescape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }
        size_t semi = text.find(';', i);
        if (semi == std::string::npos || semi - i > 10) {
            out += text[i++];
            continue;
        }
        std::string entity = text.substr(i + 1, semi - i - 1);
        if (entity == "lt") out += '<';
        else if (entity == "gt") out += '>';
        else if (entity == "amp") out += '&';
        else if (entity == "quot") out += '"';
        else if (entity == "apos") out += '\'';
        else if (entity.size() > 1 && entity[0] == '#') {
            try {
                unsigned long code = entity[1] == 'x' ? std::stoul(entity.substr(2), nullptr, 16)
                                                      : std::stoul(entity.substr(1));
                // Messages are informational: non-ASCII code points become '?'
                out += code < 128 ? static_cast<char>(code) : '?';
            } catch (const std::exception&) {
                out += text.substr(i, semi - i + 1);
            }
        } else {
            out += text.substr(i, semi - i + 1);
        }
        i = semi + 1;
    }
    return out;
}

// Drop comments and CDATA so markup inside them is not mistaken for tags
std::string strip_xml_noise(const std::string& xml) {
    std::string out;
    out.reserve(xml.size());
    size_t pos = 0;
    while (pos < xml.size()) {
        size_t comment = xml.find("<!--", pos);
        size_t cdata = xml.find("<![CDATA[", pos);
        size_t next = std::min(comment, cdata);
        if (next == std::string::npos) {
            out.append(xml, pos, std::string::npos);
            break;
        }
        out.append(xml, pos, next - pos);
        const char* terminator = next == comment ? "-->" : "]]>";
        size_t end = xml.find(terminator, next);
        if (end == std::string::npos) {
            throw ParseError("unterminated comment or CDATA section");
        }
        pos = end + 3;
    }
    return out;
}

// Position of the '>' closing the tag that starts at pos, honoring quotes
size_t find_tag_end(const std::string& xml, size_t pos) {
    char quote = 0;
    for (size_t i = pos; i < xml.size(); ++i) {
        char c = xml[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i;
        }
    }
    return std::string::npos;
}

// Finds "<name" followed by whitespace, '/' or '>'
size_t find_open_tag(const std::string& xml, const std::string& name, size_t from, size_t until) {
    std::string needle = "<" + name;
    size_t pos = from;
    while ((pos = xml.find(needle, pos)) != std::string::npos && pos < until) {
        size_t after = pos + needle.size();
        if (after < xml.size()) {
            char c = xml[after];
            if (c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c))) {
                return pos;
            }
        }
        pos = after;
    }
    return std::string::npos;
}

// Value of name="..." or name='...' inside a start tag
std::string attribute(const std::string& tag, const std::string& name) {
    size_t i = 0;
    while (i < tag.size() && !is_space(tag[i]) && tag[i] != '>' && tag[i] != '/') ++i;
    while (i < tag.size()) {
        while (i < tag.size() && (is_space(tag[i]) || tag[i] == '/')) ++i;
        size_t key_start = i;
        while (i < tag.size() && tag[i] != '=' && tag[i] != '>' && tag[i] != '/' && !is_space(tag[i])) ++i;
        std::string key = tag.substr(key_start, i - key_start);
        while (i < tag.size() && is_space(tag[i])) ++i;
        if (i >= tag.size() || tag[i] != '=') {
            if (key.empty()) ++i;
            continue;
        }
        ++i;
        while (i < tag.size() && is_space(tag[i])) ++i;
        if (i >= tag.size()) break;

        char quote = tag[i];
        if (quote != '"' && quote != '\'') {
            while (i < tag.size() && !is_space(tag[i]) && tag[i] != '>') ++i;
            continue;
        }
        size_t value_end = tag.find(quote, i + 1);
        if (value_end == std::string::npos) break;
        if (key == name) {
            return xml_unescape(tag.substr(i + 1, value_end - i - 1));
        }
        i = value_end + 1;
    }
    return "";
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string first_line(const std::string& s) {
    std::string t = trim(s);
    return t.substr(0, t.find('\n'));
}

// Bounded decimal count; report text is untrusted
int parse_count(const std::string& digits) {
    long long n = 0;
    for (char c : digits) {
        n = n * 10 + (c - '0');
        if (n > MAX_REPORTED_TESTS) {
            throw ParseError("test count out of range: " + digits.substr(0, 20));
        }
    }
    return static_cast<int>(n);
}

std::string json_text(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isNull()) return "";
    if (!value.isString()) {
        throw ParseError(std::string("\"") + key + "\" is not a string");
    }
    return value.asString();
}

int json_count(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isNull()) return 0;
    if (!value.isInt()) {
        throw ParseError(std::string("\"") + key + "\" is not an integer");
    }
    int n = value.asInt();
    if (n < 0 || n > MAX_REPORTED_TESTS) {
        throw ParseError(std::string("\"") + key + "\" out of range: " + std::to_string(n));
    }
    return n;
}

// "PASS name" or "FAIL: name: message"
bool scan_marker(const std::string& line, const std::string& keyword,
                 std::string& name, std::string& message) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos || line.compare(pos, keyword.size(), keyword) != 0) {
        return false;
    }
    pos += keyword.size();
    if (pos >= line.size() || (line[pos] != ':' && !is_space(line[pos]))) {
        return false;
    }
    std::string rest = trim(line.substr(pos + 1));
    size_t colon = keyword == "FAIL" ? rest.find(':') : std::string::npos;
    name = trim(rest.substr(0, colon));
    message = colon == std::string::npos ? "" : trim(rest.substr(colon + 1));
    return !name.empty();
}

struct TapLine {
    int indent = 0;
    bool passed = true;
    std::string description;
    std::string directive;                // Upper-cased, e.g. "SKIP"
};

// "[not ]ok [N] [- description] [# DIRECTIVE ...]"
bool scan_tap(const std::string& line, TapLine& tap) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos) return false;
    tap.indent = static_cast<int>(pos);
    tap.passed = true;
    if (line.compare(pos, 4, "not ") == 0) {
        tap.passed = false;
        pos += 4;
    }
    if (line.compare(pos, 2, "ok") != 0) return false;
    pos += 2;
    if (pos < line.size() && is_word(line[pos])) return false;

    while (pos < line.size() && is_space(line[pos])) ++pos;
    while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) ++pos;
    while (pos < line.size() && is_space(line[pos])) ++pos;
    if (pos < line.size() && line[pos] == '-') {
        ++pos;
        while (pos < line.size() && is_space(line[pos])) ++pos;
    }

    size_t hash = line.find('#', pos);
    tap.description = trim(line.substr(pos, hash == std::string::npos ? std::string::npos : hash - pos));
    tap.directive.clear();
    if (hash != std::string::npos) {
        size_t d = hash + 1;
        while (d < line.size() && is_space(line[d])) ++d;
        while (d < line.size() && is_word(line[d])) {
            tap.directive += static_cast<char>(std::toupper(static_cast<unsigned char>(line[d])));
            ++d;
        }
    }
    return true;
}

// Finds every "<N> passed|failed|error|errors" in the line and, when outcome
// is given, adds the counts. Returns whether any was found.
bool scan_summary_counts(const std::string& line, TestOutcome* outcome) {
    bool found = false;
    size_t i = 0;
    while (i < line.size()) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
            ++i;
            continue;
        }
        size_t digits_end = i;
        while (digits_end < line.size() && std::isdigit(static_cast<unsigned char>(line[digits_end]))) {
            ++digits_end;
        }
        size_t word_start = digits_end + 1;
        size_t word_end = word_start;
        if (digits_end < line.size() && line[digits_end] == ' ') {
            while (word_end < line.size() && std::isalpha(static_cast<unsigned char>(line[word_end]))) {
                ++word_end;
            }
        }
        std::string word = word_end > word_start ? line.substr(word_start, word_end - word_start) : "";
        if (word == "passed" || word == "failed" || word == "error" || word == "errors") {
            found = true;
            if (!outcome) {
                break;
            }
            int n = parse_count(line.substr(i, digits_end - i));
            if (word == "passed") {
                outcome->passed += n;
            } else {
                outcome->failed += n;
            }
            outcome->total = outcome->passed + outcome->failed;
        }
        i = digits_end;
    }
    return found;
}

// "===== 1 failed, 4 passed in 0.12s ====="
bool is_summary_line(const std::string& line) {
    if (line.size() < 4 || line.front() != '=' || line.back() != '=') {
        return false;
    }
    size_t open = line.find_first_not_of('=');
    size_t close = line.find_last_not_of('=');
    if (open == std::string::npos || line[open] != ' ' || line[close] != ' ') {
        return false;
    }
    return scan_summary_counts(line, nullptr);
}

} // namespace

void ResultParser::add_case(TestOutcome& outcome, const std::string& name,
                            bool passed, const std::string& message) {
    TestCaseResult tc;
    tc.name = name;
    tc.passed = passed;
    tc.message = passed ? "" : message;
    outcome.cases.push_back(tc);
    outcome.total++;
    if (passed) {
        outcome.passed++;
    } else {
        outcome.failed++;
    }
}

TestOutcome ResultParser::parse_junit_xml(const std::string& raw) {
    std::string xml = strip_xml_noise(raw);
    if (find_open_tag(xml, "testsuite", 0, xml.size()) == std::string::npos &&
        find_open_tag(xml, "testsuites", 0, xml.size()) == std::string::npos) {
        throw ParseError("no <testsuite> element in JUnit report");
    }

    TestOutcome outcome;
    size_t pos = 0;
    while ((pos = find_open_tag(xml, "testcase", pos, xml.size())) != std::string::npos) {
        size_t tag_end = find_tag_end(xml, pos);
        if (tag_end == std::string::npos) {
            throw ParseError("unterminated <testcase> tag");
        }
        std::string tag = xml.substr(pos, tag_end - pos + 1);

        std::string name = attribute(tag, "name");
        std::string classname = attribute(tag, "classname");
        if (name.empty()) {
            throw ParseError("<testcase> without a name");
        }
        if (!classname.empty()) {
            name = classname + "." + name;
        }

        // Self-closing testcase: passed
        if (tag.size() >= 2 && tag[tag.size() - 2] == '/') {
            add_case(outcome, name, true, "");
            pos = tag_end + 1;
            continue;
        }

        size_t close = xml.find("</testcase>", tag_end);
        if (close == std::string::npos) {
            throw ParseError("missing </testcase> for " + name);
        }

        size_t body_start = tag_end + 1;
        if (find_open_tag(xml, "skipped", body_start, close) != std::string::npos) {
            pos = close + 11;
            continue;
        }

        size_t problem = find_open_tag(xml, "failure", body_start, close);
        if (problem == std::string::npos) {
            problem = find_open_tag(xml, "error", body_start, close);
        }

        if (problem == std::string::npos) {
            add_case(outcome, name, true, "");
        } else {
            size_t problem_end = find_tag_end(xml, problem);
            if (problem_end == std::string::npos || problem_end > close) {
                throw ParseError("malformed failure element in " + name);
            }
            std::string problem_tag = xml.substr(problem, problem_end - problem + 1);
            std::string message = attribute(problem_tag, "message");
            if (message.empty() && problem_tag[problem_tag.size() - 2] != '/') {
                size_t text_end = xml.find("</", problem_end);
                if (text_end != std::string::npos && text_end < close) {
                    message = xml_unescape(xml.substr(problem_end + 1, text_end - problem_end - 1));
                }
            }
            add_case(outcome, name, false, first_line(message));
        }
        pos = close + 11;
    }
    return outcome;
}

TestOutcome ResultParser::parse_json_report(const std::string& json) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(json);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw ParseError("invalid JSON report: " + errors);
    }
    if (!root.isObject()) {
        throw ParseError("JSON report is not an object");
    }

    TestOutcome outcome;
    if (root.isMember("tests")) {
        const Json::Value& tests = root["tests"];
        if (!tests.isArray()) {
            throw ParseError("\"tests\" is not an array");
        }
        for (const auto& test : tests) {
            if (!test.isObject()) {
                throw ParseError("test entry is not an object");
            }
            std::string name = test.isMember("name") ? json_text(test, "name")
                                                     : json_text(test, "nodeid");
            std::string result = json_text(test, "outcome");
            if (name.empty() || result.empty()) {
                throw ParseError("test entry without name or outcome");
            }

            std::string message = json_text(test, "message");
            if (message.empty() && test.isMember("call") && test["call"].isObject()) {
                message = first_line(json_text(test["call"], "longrepr"));
            }

            if (result == "passed" || result == "pass" || result == "ok" ||
                result == "success" || result == "xpassed") {
                add_case(outcome, name, true, "");
            } else if (result == "failed" || result == "fail" || result == "failure" ||
                       result == "error") {
                add_case(outcome, name, false, message);
            } else if (result == "skipped" || result == "skip" || result == "xfailed") {
                continue;
            } else {
                throw ParseError("unknown outcome '" + result + "' for " + name);
            }
        }
        return outcome;
    }

    if (root.isMember("summary") && root["summary"].isObject()) {
        const Json::Value& summary = root["summary"];
        outcome.passed = json_count(summary, "passed") + json_count(summary, "xpassed");
        outcome.failed = json_count(summary, "failed") + json_count(summary, "error");
        outcome.total = outcome.passed + outcome.failed;
        return outcome;
    }

    throw ParseError("JSON report has neither \"tests\" nor \"summary\"");
}

TestOutcome ResultParser::parse_stdout(const std::string& output) {
    TestOutcome markers;
    TestOutcome tap;
    int previous_tap_indent = -1;
    std::string summary_line;

    std::istringstream stream(output);
    std::string line;
    std::string name;
    std::string message;
    TapLine tap_line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (scan_marker(line, "PASS", name, message)) {
            add_case(markers, name, true, "");
        } else if (scan_marker(line, "FAIL", name, message)) {
            add_case(markers, name, false, message);
        } else if (scan_tap(line, tap_line)) {
            // A result following deeper-indented results closes a parent
            // (a file or suite), not a test of its own
            bool is_parent = previous_tap_indent > tap_line.indent;
            previous_tap_indent = tap_line.indent;
            if (is_parent || tap_line.directive == "SKIP" || tap_line.directive == "TODO") {
                continue;
            }
            add_case(tap, tap_line.description, tap_line.passed, tap_line.passed ? "" : "not ok");
        } else if (is_summary_line(line)) {
            summary_line = line;
        }
    }

    if (markers.total > 0) {
        return markers;
    }
    if (tap.total > 0) {
        return tap;
    }
    if (!summary_line.empty()) {
        TestOutcome outcome;
        scan_summary_counts(summary_line, &outcome);
        return outcome;
    }

    throw ParseError("no test results found in output");
}

ParseOutcome ResultParser::parse(const ExecutionResult& result, ReportFormat format) {
    ParseOutcome parsed;
    try {
        if (format != ReportFormat::STDOUT && !result.report_files.empty()) {
            // Several report files (one per suite) are merged
            std::string sources;
            for (const auto& [path, content] : result.report_files) {
                TestOutcome part = format == ReportFormat::JUNIT_XML ? parse_junit_xml(content)
                                                                     : parse_json_report(content);
                parsed.outcome.total += part.total;
                parsed.outcome.passed += part.passed;
                parsed.outcome.failed += part.failed;
                parsed.outcome.cases.insert(parsed.outcome.cases.end(),
                                            part.cases.begin(), part.cases.end());
                sources += (sources.empty() ? "" : ",") + path;
            }
            parsed.source = sources;
        } else {
            parsed.outcome = parse_stdout(result.stdout_output);
            parsed.source = "stdout";
        }
        const TestOutcome& o = parsed.outcome;
        if (o.passed < 0 || o.failed < 0 || o.passed + o.failed != o.total) {
            throw ParseError("inconsistent test counts");
        }
        parsed.ok = true;
    } catch (const ParseError& e) {
        parsed.ok = false;
        parsed.outcome = TestOutcome();
        parsed.error = e.what();
    } catch (const std::exception& e) {
        parsed.ok = false;
        parsed.outcome = TestOutcome();
        parsed.error = std::string("unreadable report: ") + e.what();
    }
    return parsed;
}

Score score_outcome(const TestOutcome& outcome) {
    Score s;
    if (outcome.total <= 0) {
        return s;
    }
    int passed = std::clamp(outcome.passed, 0, outcome.total);
    s.pass_rate = static_cast<double>(passed) / static_cast<double>(outcome.total);
    s.score = static_cast<int>(std::lround(s.pass_rate * 100.0));
    return s;
}

std::string outcome_message(const TestOutcome& outcome) {
    if (outcome.total == 0) {
        return "No tests were run";
    }
    if (outcome.failed == 0) {
        return "All tests passed";
    }
    return std::to_string(outcome.failed) + " of " + std::to_string(outcome.total) + " tests failed";
}

} // namespace gradebox
