/**
 * @file Expression.cpp
 * @brief Template splitting and expression evaluation
 */

#include "shortcut/Expression.hpp"
#include "shortcut/Errors.hpp"
#include "shortcut/Util.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

namespace shortcut {

const std::string EXPRESSION_PREFIX = "#{";
const std::string EXPRESSION_SUFFIX = "}";

bool is_template_expression(const std::string& raw) {
    return starts_with(trim(raw), EXPRESSION_PREFIX) && ends_with(raw, EXPRESSION_SUFFIX);
}

namespace {

/**
 * @brief One piece of a template: literal text or an expression body
 */
struct Segment {
    bool is_expression;
    std::string text;
};

/**
 * @brief Split a template into literal and expression segments
 *
 * Quoted strings inside a block may contain '}'. A doubled quote ('')
 * inside a quoted string is an escaped quote.
 */
std::vector<Segment> split_template(const std::string& raw) {
    std::vector<Segment> segments;
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t open = raw.find(EXPRESSION_PREFIX, pos);
        if (open == std::string::npos) {
            segments.push_back({false, raw.substr(pos)});
            break;
        }
        if (open > pos) {
            segments.push_back({false, raw.substr(pos, open - pos)});
        }

        size_t i = open + EXPRESSION_PREFIX.size();
        bool in_quote = false;
        size_t close = std::string::npos;
        for (; i < raw.size(); ++i) {
            char c = raw[i];
            if (c == '\'') {
                if (in_quote && i + 1 < raw.size() && raw[i + 1] == '\'') {
                    ++i;
                    continue;
                }
                in_quote = !in_quote;
            } else if (c == '}' && !in_quote) {
                close = i;
                break;
            }
        }
        if (close == std::string::npos) {
            throw ExpressionEvaluationError(raw, "unterminated expression block starting at position " +
                                                 std::to_string(open));
        }

        std::string body = raw.substr(open + EXPRESSION_PREFIX.size(),
                                      close - open - EXPRESSION_PREFIX.size());
        if (trim(body).empty()) {
            throw ExpressionEvaluationError(raw, "empty expression block at position " +
                                                 std::to_string(open));
        }
        segments.push_back({true, body});
        pos = close + 1;
    }
    return segments;
}

std::string stringify(const Value& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "";
    return v.dump();
}

/**
 * @brief Recursive-descent evaluator over a single expression body
 */
class Parser {
public:
    Parser(const std::string& expr, const ServiceRegistry& registry)
        : expr_(expr), registry_(registry) {}

    Value parse() {
        skip_ws();
        Value v = parse_primary();
        skip_ws();
        if (pos_ < expr_.size()) {
            fail("unexpected '" + expr_.substr(pos_, 1) + "' at position " + std::to_string(pos_));
        }
        return v;
    }

private:
    const std::string& expr_;
    const ServiceRegistry& registry_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& details) const {
        throw ExpressionEvaluationError(expr_, details);
    }

    void skip_ws() {
        while (pos_ < expr_.size() && std::isspace(static_cast<unsigned char>(expr_[pos_]))) {
            ++pos_;
        }
    }

    bool peek(char c) const {
        return pos_ < expr_.size() && expr_[pos_] == c;
    }

    std::string parse_identifier() {
        if (pos_ >= expr_.size()) fail("expected identifier at end of expression");
        char c = expr_[pos_];
        if (!(std::isalpha(static_cast<unsigned char>(c)) || c == '_')) {
            fail("expected identifier at position " + std::to_string(pos_));
        }
        size_t start = pos_++;
        while (pos_ < expr_.size()) {
            char cur = expr_[pos_];
            if (std::isalnum(static_cast<unsigned char>(cur)) || cur == '_') {
                ++pos_;
            } else {
                break;
            }
        }
        return expr_.substr(start, pos_ - start);
    }

    Value parse_primary() {
        if (pos_ >= expr_.size()) fail("unexpected end of expression");

        char c = expr_[pos_];
        if (c == '\'') return parse_string();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        if (c == '@') return parse_bean();
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t at = pos_;
            std::string ident = parse_identifier();
            if (ident == "true") return true;
            if (ident == "false") return false;
            if (ident == "null") return nullptr;
            fail("unknown identifier '" + ident + "' at position " + std::to_string(at));
        }
        fail("unexpected '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    Value parse_string() {
        ++pos_; // opening quote
        std::string out;
        while (pos_ < expr_.size()) {
            char c = expr_[pos_++];
            if (c == '\'') {
                if (peek('\'')) {
                    out.push_back('\'');
                    ++pos_;
                    continue;
                }
                return out;
            }
            out.push_back(c);
        }
        fail("unterminated string literal");
    }

    Value parse_number() {
        size_t start = pos_;
        if (peek('-')) ++pos_;
        size_t digits = pos_;
        while (pos_ < expr_.size() && std::isdigit(static_cast<unsigned char>(expr_[pos_]))) ++pos_;
        if (pos_ == digits) fail("malformed number at position " + std::to_string(start));

        bool is_float = false;
        if (peek('.')) {
            size_t frac = ++pos_;
            while (pos_ < expr_.size() && std::isdigit(static_cast<unsigned char>(expr_[pos_]))) ++pos_;
            if (pos_ == frac) fail("malformed number at position " + std::to_string(start));
            is_float = true;
        }

        std::string text = expr_.substr(start, pos_ - start);
        try {
            if (is_float) return std::stod(text);
            return static_cast<int64_t>(std::stoll(text));
        } catch (const std::out_of_range&) {
            fail("number out of range: " + text);
        }
    }

    std::vector<Value> parse_arguments() {
        std::vector<Value> args;
        ++pos_; // '('
        skip_ws();
        if (peek(')')) {
            ++pos_;
            return args;
        }
        while (true) {
            skip_ws();
            args.push_back(parse_primary());
            skip_ws();
            if (peek(',')) {
                ++pos_;
                continue;
            }
            if (peek(')')) {
                ++pos_;
                return args;
            }
            fail("expected ',' or ')' at position " + std::to_string(pos_));
        }
    }

    Value parse_bean() {
        ++pos_; // '@'
        std::string bean = parse_identifier();

        // While on_bean is set, members resolve through the registry;
        // afterwards they navigate the returned value.
        bool on_bean = true;
        Value current;
        while (true) {
            skip_ws();
            if (!peek('.')) break;
            ++pos_;
            skip_ws();
            std::string member = parse_identifier();
            skip_ws();

            if (peek('(')) {
                if (!on_bean) fail("method '" + member + "' can only be called on a bean");
                current = registry_.invoke(bean, member, parse_arguments());
            } else if (on_bean) {
                current = registry_.property(bean, member);
            } else if (current.is_object() && current.contains(member)) {
                current = Value(current.at(member));
            } else {
                fail("no member '" + member + "' on " + type_name(current) + " value");
            }
            on_bean = false;
        }

        if (on_bean) return registry_.bean(bean).properties;
        return current;
    }
};

} // anonymous namespace

Value TemplateExpressionResolver::evaluate(const std::string& expr,
                                           const ServiceRegistry& registry) const {
    return Parser(expr, registry).parse();
}

Value TemplateExpressionResolver::resolve(const std::string& raw,
                                          const ServiceRegistry& registry) const {
    try {
        auto segments = split_template(raw);
        if (segments.size() == 1 && segments[0].is_expression) {
            return evaluate(segments[0].text, registry);
        }

        std::string out;
        for (const auto& seg : segments) {
            out += seg.is_expression ? stringify(evaluate(seg.text, registry)) : seg.text;
        }
        return out;
    } catch (const ExpressionEvaluationError& e) {
        if (e.expression() == raw) throw;
        throw ExpressionEvaluationError(raw, e.details());
    } catch (const std::exception& e) {
        // Bean methods may throw anything.
        throw ExpressionEvaluationError(raw, e.what());
    }
}

} // namespace shortcut
