#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "docscope/mapper/document.hpp"
#include "docscope/query/filter.hpp"

namespace docscope::query {

    // A filter over documents of type T. Default-constructed predicates are
    // absent and rejected by every client operation.
    template <typename T>
    class Predicate {
    public:
        Predicate() = default;
        explicit Predicate(Filter filter) noexcept : filter_(std::move(filter)) {}

        // Matches every document.
        [[nodiscard]] static Predicate all() { return Predicate(Filter::constant(true)); }

        [[nodiscard]] bool empty() const noexcept { return filter_.empty(); }
        [[nodiscard]] const Filter& filter() const noexcept { return filter_; }

        friend Predicate operator&&(const Predicate& a, const Predicate& b) { return Predicate(a.filter_ && b.filter_); }
        friend Predicate operator||(const Predicate& a, const Predicate& b) { return Predicate(a.filter_ || b.filter_); }
        friend Predicate operator!(const Predicate& p) { return Predicate(!p.filter_); }

    private:
        Filter filter_;
    };

    // A declared field of T. An empty name (undeclared member or unknown
    // name) yields absent predicates.
    template <typename T>
    class Field {
    public:
        explicit Field(std::string name) : name_(std::move(name)) {}

        [[nodiscard]] const std::string& name() const noexcept { return name_; }

        template <typename V>
        Predicate<T> operator==(const V& v) const { return make(CompareOp::Eq, v); }
        template <typename V>
        Predicate<T> operator!=(const V& v) const { return make(CompareOp::Ne, v); }
        template <typename V>
        Predicate<T> operator<(const V& v) const { return make(CompareOp::Lt, v); }
        template <typename V>
        Predicate<T> operator<=(const V& v) const { return make(CompareOp::Le, v); }
        template <typename V>
        Predicate<T> operator>(const V& v) const { return make(CompareOp::Gt, v); }
        template <typename V>
        Predicate<T> operator>=(const V& v) const { return make(CompareOp::Ge, v); }

        template <typename V>
        Predicate<T> in(const std::vector<V>& values) const {
            if (name_.empty()) {
                return Predicate<T>{};
            }
            std::vector<Literal> literals;
            literals.reserve(values.size());
            for (const V& v : values) {
                literals.push_back(to_literal(v));
            }
            return Predicate<T>(Filter::in(name_, std::move(literals)));
        }

    private:
        template <typename V>
        Predicate<T> make(CompareOp op, const V& v) const {
            if (name_.empty()) {
                return Predicate<T>{};
            }
            return Predicate<T>(Filter::compare(name_, op, to_literal(v)));
        }

        std::string name_;
    };

    // where(&Person::age) >= 18 && where(&Person::first_name) == "Ada"
    template <typename T, typename M>
    [[nodiscard]] Field<T> where(M T::*member) {
        return Field<T>(std::string(mapper::field_name_of<T>(member)));
    }

    // where<Person>("age"): the name is resolved case-insensitively.
    template <typename T>
    [[nodiscard]] Field<T> where(std::string_view name) {
        return Field<T>(std::string(mapper::resolve_field<T>(name)));
    }

} // namespace docscope::query
