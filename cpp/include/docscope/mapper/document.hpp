#pragma once

#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "docscope/core/errors.hpp"
#include "docscope/core/text.hpp"

namespace docscope::mapper {
    using u8 = docscope::core::u8;

    // Generic store representation of a document: a JSON object.
    using Record = nlohmann::json;

    enum class FieldAccess : u8 {
        ReadWrite = 0,
        ReadOnly = 1, // written to the store, never overwritten from a record
    };

    template <typename T, typename M>
    struct FieldDecl {
        std::string_view name;
        M T::*member;
        FieldAccess access;
    };

    template <typename T, typename M>
    [[nodiscard]] constexpr FieldDecl<T, M> field(std::string_view name, M T::*member,
        FieldAccess access = FieldAccess::ReadWrite) noexcept {
        return FieldDecl<T, M>{name, member, access};
    }

    // Specialize for every document type:
    //
    //   template <> struct DocumentTraits<Person> {
    //       static constexpr std::string_view type_name = "Person";
    //       static constexpr auto fields = std::make_tuple(
    //           field("Id", &Person::id),
    //           field("Age", &Person::age),
    //           field("EntityType", &Person::entity_type));
    //   };
    //
    // The field declared "Id" is the identifier; it is stored as "id".
    template <typename T>
    struct DocumentTraits;

    template <typename T>
    [[nodiscard]] constexpr std::string_view type_name_of() noexcept {
        return DocumentTraits<T>::type_name;
    }

    template <typename T, typename F>
    void for_each_field(F&& fn) {
        std::apply([&](const auto&... decl) { (fn(decl), ...); }, DocumentTraits<T>::fields);
    }

    [[nodiscard]] inline bool is_identifier(std::string_view declared_name) noexcept {
        return core::iequals(declared_name, core::kIdField);
    }

    // Name a declared field is stored under.
    [[nodiscard]] inline std::string store_field_name(std::string_view declared_name) {
        return is_identifier(declared_name) ? std::string(core::kStoreIdField) : std::string(declared_name);
    }

    // Declared name of a member, or empty if the member is not declared.
    template <typename T, typename M>
    [[nodiscard]] std::string_view field_name_of(M T::*member) noexcept {
        std::string_view found{};
        for_each_field<T>([&](const auto& decl) {
            if constexpr (std::is_same_v<decltype(decl.member), M T::*>) {
                if (found.empty() && decl.member == member) {
                    found = decl.name;
                }
            }
        });
        return found;
    }

    // Declared name matching `name` case-insensitively, or empty.
    template <typename T>
    [[nodiscard]] std::string_view resolve_field(std::string_view name) noexcept {
        std::string_view found{};
        for_each_field<T>([&](const auto& decl) {
            if (found.empty() && core::iequals(decl.name, name)) {
                found = decl.name;
            }
        });
        return found;
    }

    template <typename T>
    [[nodiscard]] core::Status to_record(const T& doc, Record* out) noexcept {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Mapper, core::StatusCode::Invalid, "out cannot be null");
        }
        try {
            Record rec = Record::object();
            for_each_field<T>([&](const auto& decl) {
                rec[store_field_name(decl.name)] = doc.*(decl.member);
            });
            *out = std::move(rec);
        } catch (const nlohmann::json::exception& e) {
            return core::make_status(core::StatusDomain::Mapper, core::StatusCode::Corrupt,
                std::string("cannot serialize ") + std::string(type_name_of<T>()) + ": " + e.what());
        }
        return core::ok_status();
    }

    template <typename T>
    [[nodiscard]] core::Status from_record(const Record& rec, T* out) noexcept {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Mapper, core::StatusCode::Invalid, "out cannot be null");
        }
        if (!rec.is_object()) {
            return core::make_status(core::StatusDomain::Mapper, core::StatusCode::Corrupt,
                "record for " + std::string(type_name_of<T>()) + " is not an object");
        }
        try {
            T doc{};
            for_each_field<T>([&](const auto& decl) {
                if (decl.access == FieldAccess::ReadOnly) {
                    return;
                }
                const auto it = rec.find(store_field_name(decl.name));
                if (it == rec.end() || it->is_null()) {
                    return;
                }
                it->get_to(doc.*(decl.member));
            });
            *out = std::move(doc);
        } catch (const nlohmann::json::exception& e) {
            return core::make_status(core::StatusDomain::Mapper, core::StatusCode::Corrupt,
                std::string("cannot deserialize ") + std::string(type_name_of<T>()) + ": " + e.what());
        }
        return core::ok_status();
    }

} // namespace docscope::mapper
