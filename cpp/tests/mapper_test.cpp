#include <gtest/gtest.h>

#include "docscope/mapper/document.hpp"
#include "test_documents.hpp"

using namespace docscope::mapper;
using namespace docscope::core;
using docscope_test::Account;
using docscope_test::TestObject;

TEST(Mapper, IdentifierIsStoredAsId) {
    TestObject t = docscope_test::make_test_object(30, "Grace");
    t.id = "abc";

    Record rec;
    ASSERT_TRUE(is_ok(to_record(t, &rec)));
    EXPECT_EQ(rec["id"], "abc");
    EXPECT_FALSE(rec.contains("Id"));
    EXPECT_EQ(rec["Age"], 30);
    EXPECT_EQ(rec["FirstName"], "Grace");
    EXPECT_EQ(rec["Aliases"].size(), 3u);
}

TEST(Mapper, RecordRestoresDocument) {
    const Record rec = {
        {"id", "abc"}, {"Age", 7}, {"FirstName", "Lin"}, {"Aliases", {"x"}}, {"EntityType", "Orders.TestObject"}};
    TestObject t;
    ASSERT_TRUE(is_ok(from_record(rec, &t)));
    EXPECT_EQ(t.id, "abc");
    EXPECT_EQ(t.age, 7);
    EXPECT_EQ(t.first_name, "Lin");
    ASSERT_EQ(t.aliases.size(), 1u);
    EXPECT_EQ(t.entity_type, "Orders.TestObject");
}

TEST(Mapper, MissingAndNullFieldsKeepDefaults) {
    TestObject t;
    t.age = 99; // overwritten from a fresh default, not merged
    ASSERT_TRUE(is_ok(from_record(Record{{"id", "a"}, {"FirstName", nullptr}}, &t)));
    EXPECT_EQ(t.id, "a");
    EXPECT_EQ(t.age, 0);
    EXPECT_TRUE(t.first_name.empty());
}

TEST(Mapper, ReadOnlyFieldsAreWrittenButNotRead) {
    Account a;
    a.id = "acct";
    a.balance = 12.5;
    a.active = true;
    a.created_by = "alice";

    Record rec;
    ASSERT_TRUE(is_ok(to_record(a, &rec)));
    EXPECT_EQ(rec["CreatedBy"], "alice");

    Account back;
    ASSERT_TRUE(is_ok(from_record(rec, &back)));
    EXPECT_EQ(back.id, "acct");
    EXPECT_DOUBLE_EQ(back.balance, 12.5);
    EXPECT_TRUE(back.active);
    EXPECT_TRUE(back.created_by.empty());
}

TEST(Mapper, TypeMismatchIsCorrupt) {
    TestObject t;
    const Status s = from_record(Record{{"id", "a"}, {"Age", "old"}}, &t);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_EQ(s.domain, StatusDomain::Mapper);
}

TEST(Mapper, NonObjectIsCorrupt) {
    TestObject t;
    EXPECT_EQ(from_record(Record::array(), &t).code, StatusCode::Corrupt);
    EXPECT_EQ(from_record(Record("text"), &t).code, StatusCode::Corrupt);
}

TEST(Mapper, NullOutputs) {
    TestObject t;
    EXPECT_EQ(to_record(t, nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(from_record(Record::object(), static_cast<TestObject*>(nullptr)).code, StatusCode::Invalid);
}

TEST(Mapper, FieldNames) {
    EXPECT_EQ(field_name_of(&TestObject::first_name), "FirstName");
    EXPECT_EQ(field_name_of(&TestObject::id), "Id");
    EXPECT_EQ(field_name_of(&Account::created_by), "CreatedBy");

    EXPECT_EQ(resolve_field<TestObject>("age"), "Age");
    EXPECT_EQ(resolve_field<TestObject>("FIRSTNAME"), "FirstName");
    EXPECT_EQ(resolve_field<TestObject>("Missing"), "");

    EXPECT_EQ(store_field_name("Id"), "id");
    EXPECT_EQ(store_field_name("Age"), "Age");
    EXPECT_EQ(type_name_of<TestObject>(), "TestObject");
    EXPECT_EQ(type_name_of<Account>(), "Account");
}
