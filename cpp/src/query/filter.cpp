#include "docscope/query/filter.hpp"

namespace docscope::query {

Filter Filter::constant(bool value) {
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Constant;
    n->constant = value;
    return Filter(std::move(n));
}

Filter Filter::compare(std::string field, CompareOp op, Literal value) {
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Compare;
    n->op = op;
    n->field = std::move(field);
    n->values.push_back(std::move(value));
    return Filter(std::move(n));
}

Filter Filter::in(std::string field, std::vector<Literal> values) {
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::In;
    n->field = std::move(field);
    n->values = std::move(values);
    return Filter(std::move(n));
}

Filter operator&&(const Filter& a, const Filter& b) {
    if (a.empty() || b.empty()) {
        return Filter{};
    }
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::And;
    n->children = {a.root_, b.root_};
    return Filter(std::move(n));
}

Filter operator||(const Filter& a, const Filter& b) {
    if (a.empty() || b.empty()) {
        return Filter{};
    }
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Or;
    n->children = {a.root_, b.root_};
    return Filter(std::move(n));
}

Filter operator!(const Filter& f) {
    if (f.empty()) {
        return Filter{};
    }
    auto n = std::make_shared<Node>();
    n->kind = NodeKind::Not;
    n->children = {f.root_};
    return Filter(std::move(n));
}

} // namespace docscope::query
