#include "docscope/query/query.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

#include "docscope/core/text.hpp"

namespace docscope::query {

using namespace docscope::core;

namespace {
    [[nodiscard]] Status invalid(std::string message) noexcept {
        return make_status(StatusDomain::Query, StatusCode::Invalid, std::move(message));
    }

    void append_quoted(std::string* out, std::string_view text, char quote) {
        *out += quote;
        for (char c : text) {
            if (c == quote) {
                *out += quote;
            }
            *out += c;
        }
        *out += quote;
    }

    [[nodiscard]] Status append_field(std::string* out, std::string_view field) {
        if (field.empty()) {
            return invalid("filter references an unnamed field");
        }
        if (iequals(field, kIdField)) {
            *out += kStoreIdField;
            return ok_status();
        }
        // The name sits inside a quoted JSON path inside a SQL string literal.
        if (field.find('"') != std::string_view::npos) {
            return invalid("field name '" + std::string(field) + "' cannot contain a double quote");
        }
        std::string path = "$.\"";
        path += field;
        path += '"';

        *out += "json_extract(body, ";
        append_quoted(out, path, '\'');
        *out += ')';
        return ok_status();
    }

    [[nodiscard]] Status append_literal(std::string* out, const Literal& value) {
        if (std::holds_alternative<std::nullptr_t>(value)) {
            *out += "NULL";
        } else if (const bool* b = std::get_if<bool>(&value)) {
            // json_extract yields 1/0 for JSON true/false
            *out += *b ? '1' : '0';
        } else if (const i64* i = std::get_if<i64>(&value)) {
            *out += std::to_string(*i);
        } else if (const u64* u = std::get_if<u64>(&value)) {
            *out += std::to_string(*u);
        } else if (const double* d = std::get_if<double>(&value)) {
            if (!std::isfinite(*d)) {
                return invalid("non-finite numeric literal");
            }
            char buf[64];
            const auto r = std::to_chars(buf, buf + sizeof(buf), *d);
            if (r.ec != std::errc()) {
                return invalid("unrepresentable numeric literal");
            }
            out->append(buf, r.ptr);
        } else {
            append_quoted(out, std::get<std::string>(value), '\'');
        }
        return ok_status();
    }

    [[nodiscard]] const char* op_text(CompareOp op) noexcept {
        switch (op) {
            case CompareOp::Eq: return " = ";
            case CompareOp::Ne: return " != ";
            case CompareOp::Lt: return " < ";
            case CompareOp::Le: return " <= ";
            case CompareOp::Gt: return " > ";
            case CompareOp::Ge: return " >= ";
        }
        return " = ";
    }

    [[nodiscard]] Status render_compare(const Node& n, std::string* out) {
        if (n.values.size() != 1) {
            return invalid("comparison needs exactly one operand");
        }
        const Literal& value = n.values.front();

        *out += '(';
        Status s = append_field(out, n.field);
        if (!is_ok(s)) {
            return s;
        }

        if (std::holds_alternative<std::nullptr_t>(value)) {
            if (n.op == CompareOp::Eq) {
                *out += " IS NULL)";
            } else if (n.op == CompareOp::Ne) {
                *out += " IS NOT NULL)";
            } else {
                return invalid("null can only be compared for equality");
            }
            return ok_status();
        }

        *out += op_text(n.op);
        s = append_literal(out, value);
        if (!is_ok(s)) {
            return s;
        }
        *out += ')';
        return ok_status();
    }

    [[nodiscard]] Status render_in(const Node& n, std::string* out) {
        if (n.values.empty()) {
            // matches nothing
            *out += '0';
            return ok_status();
        }

        *out += '(';
        Status s = append_field(out, n.field);
        if (!is_ok(s)) {
            return s;
        }
        *out += " IN (";
        for (size_t i = 0; i < n.values.size(); ++i) {
            if (std::holds_alternative<std::nullptr_t>(n.values[i])) {
                return invalid("IN list cannot contain null");
            }
            if (i > 0) {
                *out += ", ";
            }
            s = append_literal(out, n.values[i]);
            if (!is_ok(s)) {
                return s;
            }
        }
        *out += "))";
        return ok_status();
    }

    [[nodiscard]] Status render_node(const Node& n, std::string* out) {
        switch (n.kind) {
            case NodeKind::Constant:
                *out += n.constant ? '1' : '0';
                return ok_status();
            case NodeKind::Compare:
                return render_compare(n, out);
            case NodeKind::In:
                return render_in(n, out);
            case NodeKind::And:
            case NodeKind::Or: {
                if (n.children.size() != 2 || !n.children[0] || !n.children[1]) {
                    return invalid("malformed boolean node");
                }
                *out += '(';
                Status s = render_node(*n.children[0], out);
                if (!is_ok(s)) {
                    return s;
                }
                *out += n.kind == NodeKind::And ? " AND " : " OR ";
                s = render_node(*n.children[1], out);
                if (!is_ok(s)) {
                    return s;
                }
                *out += ')';
                return ok_status();
            }
            case NodeKind::Not: {
                if (n.children.size() != 1 || !n.children[0]) {
                    return invalid("malformed negation node");
                }
                *out += "(NOT ";
                Status s = render_node(*n.children[0], out);
                if (!is_ok(s)) {
                    return s;
                }
                *out += ')';
                return ok_status();
            }
        }
        return invalid("unknown filter node");
    }
} // namespace

Status parse_sort_key(std::string_view sort_key, SortSpec* out) noexcept {
    if (out == nullptr) {
        return invalid("out cannot be null");
    }

    std::string_view column = trim(sort_key.substr(0, sort_key.find(',')));

    SortDirection direction = SortDirection::Ascending;
    if (!column.empty() && column.front() == '-') {
        direction = SortDirection::Descending;
        column = trim(column.substr(1));
    }
    if (column.empty()) {
        return invalid("sortBy cannot be null or empty");
    }

    out->field = std::string(column);
    out->direction = direction;
    return ok_status();
}

Status render(const Query& q, std::string_view collection, std::string* out) noexcept {
    if (out == nullptr) {
        return invalid("out cannot be null");
    }
    if (q.filter.empty()) {
        return invalid("predicate cannot be null");
    }
    if (is_blank(collection)) {
        return invalid("collection cannot be null or empty");
    }

    std::string text = q.projection == Projection::IdOnly ? "SELECT id FROM " : "SELECT id, body FROM ";
    append_quoted(&text, collection, '"');
    text += " WHERE ";

    Status s = render_node(*q.filter.root(), &text);
    if (!is_ok(s)) {
        return s;
    }

    if (q.sort) {
        text += " ORDER BY ";
        s = append_field(&text, q.sort->field);
        if (!is_ok(s)) {
            return s;
        }
        text += q.sort->direction == SortDirection::Descending ? " DESC" : " ASC";
        // Ties are broken by id so that the id window of a page and the
        // re-fetch of that window agree on the order.
        if (!iequals(q.sort->field, kIdField)) {
            text += ", id ASC";
        }
    }

    if (q.limit) {
        text += " LIMIT ";
        text += std::to_string(*q.limit);
    }

    *out = std::move(text);
    return ok_status();
}

} // namespace docscope::query
