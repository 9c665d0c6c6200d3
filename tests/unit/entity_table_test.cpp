#include <fidelity/text/entity_table.h>
#include <gtest/gtest.h>
#include <atomic>
#include <cctype>
#include <string>
#include <thread>
#include <vector>

using fidelity::text::EntityTable;
using fidelity::text::is_reserved_entity;

namespace {

bool is_decimal_reference(std::string_view ref) {
    if (ref.size() < 4 || ref.substr(0, 2) != "&#" || ref.back() != ';') return false;
    for (size_t i = 2; i + 1 < ref.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(ref[i]))) return false;
    }
    return true;
}

} // namespace

TEST(EntityTableTest, CarriesTheHtml4SetWithoutReservedNames) {
    EXPECT_EQ(EntityTable::instance().size(), 248u);
}

TEST(EntityTableTest, ReservedEntitiesAreAbsent) {
    const auto& table = EntityTable::instance();
    for (const char* name : {"quot", "amp", "lt", "gt", "apos"}) {
        EXPECT_TRUE(is_reserved_entity(name)) << name;
        EXPECT_FALSE(table.contains(name)) << name;
        EXPECT_FALSE(table.lookup(name).has_value()) << name;
    }
}

TEST(EntityTableTest, EveryValueIsAWellFormedNumericReference) {
    size_t visited = 0;
    EntityTable::instance().for_each([&](std::string_view name, std::string_view ref) {
        EXPECT_FALSE(name.empty());
        EXPECT_FALSE(is_reserved_entity(name)) << name;
        EXPECT_TRUE(is_decimal_reference(ref)) << name << " -> " << ref;
        ++visited;
    });
    EXPECT_EQ(visited, EntityTable::instance().size());
}

TEST(EntityTableTest, KnownLookups) {
    const auto& table = EntityTable::instance();
    EXPECT_EQ(table.lookup("nbsp").value(), "&#160;");
    EXPECT_EQ(table.lookup("eacute").value(), "&#233;");
    EXPECT_EQ(table.lookup("Oslash").value(), "&#216;");
    EXPECT_EQ(table.lookup("euro").value(), "&#8364;");
    EXPECT_EQ(table.lookup("mdash").value(), "&#8212;");
    EXPECT_EQ(table.lookup("micro").value(), "&#181;");
    EXPECT_EQ(table.lookup("deg").value(), "&#176;");
    EXPECT_EQ(table.lookup("diams").value(), "&#9830;");
}

TEST(EntityTableTest, LookupIsCaseSensitive) {
    const auto& table = EntityTable::instance();
    EXPECT_EQ(table.lookup("Eacute").value(), "&#201;");
    EXPECT_EQ(table.lookup("eacute").value(), "&#233;");
    EXPECT_EQ(table.lookup("rArr").value(), "&#8658;");
    EXPECT_EQ(table.lookup("rarr").value(), "&#8594;");
    EXPECT_FALSE(table.lookup("EACUTE").has_value());
}

TEST(EntityTableTest, MissingNamesAreNotFound) {
    const auto& table = EntityTable::instance();
    EXPECT_FALSE(table.lookup("").has_value());
    EXPECT_FALSE(table.lookup("&eacute;").has_value());
    EXPECT_FALSE(table.lookup("unknownEntity123").has_value());
}

TEST(EntityTableTest, InstanceIsShared) {
    EXPECT_EQ(&EntityTable::instance(), &EntityTable::instance());
}

TEST(EntityTableTest, ConcurrentFirstUseAndLookups) {
    std::atomic<int> hits{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&hits] {
            for (int i = 0; i < 1000; ++i) {
                if (EntityTable::instance().lookup("hellip") == std::string_view("&#8230;")) {
                    ++hits;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(hits.load(), 8000);
}
