#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "docscope/core/types.hpp"

namespace docscope::query {
    using u8 = docscope::core::u8;
    using i64 = docscope::core::i64;
    using u64 = docscope::core::u64;

    // Unsigned values above INT64_MAX are held as u64 and rendered exactly.
    using Literal = std::variant<std::nullptr_t, bool, i64, u64, double, std::string>;

    enum class CompareOp : u8 {
        Eq = 0,
        Ne,
        Lt,
        Le,
        Gt,
        Ge,
    };

    enum class NodeKind : u8 {
        Constant = 0,
        Compare,
        In,
        And,
        Or,
        Not,
    };

    struct Node {
        NodeKind kind{NodeKind::Constant};
        bool constant{false};                          // Constant
        CompareOp op{CompareOp::Eq};                   // Compare
        std::string field;                             // Compare, In (declared field name)
        std::vector<Literal> values;                   // Compare (one), In (any)
        std::vector<std::shared_ptr<const Node>> children; // And, Or (two), Not (one)
    };

    // Immutable filter expression. A default-constructed Filter is "absent":
    // combining an absent filter with anything yields an absent filter.
    class Filter {
    public:
        Filter() = default;

        [[nodiscard]] static Filter constant(bool value);
        [[nodiscard]] static Filter compare(std::string field, CompareOp op, Literal value);
        [[nodiscard]] static Filter in(std::string field, std::vector<Literal> values);

        [[nodiscard]] bool empty() const noexcept { return root_ == nullptr; }
        [[nodiscard]] const Node* root() const noexcept { return root_.get(); }

        friend Filter operator&&(const Filter& a, const Filter& b);
        friend Filter operator||(const Filter& a, const Filter& b);
        friend Filter operator!(const Filter& f);

    private:
        explicit Filter(std::shared_ptr<const Node> root) noexcept : root_(std::move(root)) {}

        std::shared_ptr<const Node> root_;
    };

    template <typename V>
    [[nodiscard]] Literal to_literal(const V& v) {
        if constexpr (std::is_same_v<V, bool>) {
            return Literal{v};
        } else if constexpr (std::is_same_v<V, std::nullptr_t>) {
            return Literal{nullptr};
        } else if constexpr (std::is_integral_v<V> && std::is_unsigned_v<V>) {
            if (static_cast<u64>(v) > static_cast<u64>(std::numeric_limits<i64>::max())) {
                return Literal{static_cast<u64>(v)};
            }
            return Literal{static_cast<i64>(v)};
        } else if constexpr (std::is_integral_v<V>) {
            return Literal{static_cast<i64>(v)};
        } else if constexpr (std::is_floating_point_v<V>) {
            return Literal{static_cast<double>(v)};
        } else {
            static_assert(std::is_convertible_v<const V&, std::string_view>,
                "filter literals must be bool, integral, floating point, null or string");
            return Literal{std::string(std::string_view(v))};
        }
    }

} // namespace docscope::query
