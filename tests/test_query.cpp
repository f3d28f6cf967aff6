// Copyright 2026 The sqlocale Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <sqlocale.h>

#include "test_support.h"

using namespace sqlocale;
using namespace sqlocale::test;

TEST_CASE("query: empty select reads every column") {
    SelectQuery q;
    q.add_from("SiteTree");
    CHECK(q.to_sql().text == "SELECT * FROM \"SiteTree\"");
}

TEST_CASE("query: query without a source is refused") {
    SelectQuery q;
    CHECK_THROWS_AS(q.to_sql(), Error);
}

TEST_CASE("query: select, joins, where and order") {
    SelectQuery q;
    q.add_from("SiteTree");
    q.add_left_join("Page", "P",
                    {{ColumnRef{"P", "ID"}, CompareOp::Eq, ColumnRef{"SiteTree", "ID"}}});
    q.select = {{ColumnRef{"SiteTree", "Title"}, ""},
                {ColumnRef{"P", "Extra"}, "More"}};
    q.where = {{ColumnRef{"SiteTree", "ID"}, CompareOp::Ge, Param{std::int64_t{2}}}};
    q.order_by = {{ColumnRef{"SiteTree", "Title"}, true}};

    Sql sql = q.to_sql();
    CHECK(sql.text ==
          "SELECT \"SiteTree\".\"Title\", \"P\".\"Extra\" AS \"More\" "
          "FROM \"SiteTree\" LEFT JOIN \"Page\" AS \"P\" "
          "ON \"P\".\"ID\" = \"SiteTree\".\"ID\" "
          "WHERE \"SiteTree\".\"ID\" >= ? "
          "ORDER BY \"SiteTree\".\"Title\" DESC");
    REQUIRE(sql.params.size() == 1);
    CHECK(std::get<std::int64_t>(sql.params[0]) == 2);
}

TEST_CASE("query: localised column falls back through its aliases") {
    SelectQuery q;
    q.add_from("SiteTree");
    q.select = {{LocalisedColumn{ColumnRef{"SiteTree", "Title"}, {"L1", "L2"}}, ""}};

    CHECK(q.to_sql().text ==
          "SELECT CASE WHEN \"L1\".\"RecordID\" IS NOT NULL THEN \"L1\".\"Title\" "
          "WHEN \"L2\".\"RecordID\" IS NOT NULL THEN \"L2\".\"Title\" "
          "ELSE \"SiteTree\".\"Title\" END AS \"Title\" FROM \"SiteTree\"");
}

TEST_CASE("query: rename keeps aliases") {
    SelectQuery q;
    q.add_from("SiteTree");
    q.add_left_join("SiteTree_Localised", "L", {});
    q.rename_table("SiteTree_Localised", "SiteTree_Localised_Live");

    REQUIRE(q.find("L") != nullptr);
    CHECK(q.find("L")->table == "SiteTree_Localised_Live");
    CHECK(q.find("SiteTree")->table == "SiteTree");
    CHECK_THROWS_AS(q.set_join_filter("missing", {}), Error);
}

TEST_CASE("query: execute binds parameters and reads rows") {
    DB d;
    d.exec("CREATE TABLE t (ID INTEGER PRIMARY KEY, Name TEXT, Score REAL, Data BLOB)");
    d.exec("INSERT INTO t VALUES (1, 'one', 1.5, x'0102'), (2, 'two', NULL, NULL)");

    SelectQuery q;
    q.add_from("t");
    q.where = {{ColumnRef{"t", "Name"}, CompareOp::Eq, Param{std::string("one")}}};
    auto rows = execute(d.db, q);
    REQUIRE(rows.size() == 1);
    CHECK(std::get<std::int64_t>(rows[0]["ID"]) == 1);
    CHECK(std::get<double>(rows[0]["Score"]) == 1.5);
    CHECK(std::get<std::vector<std::uint8_t>>(rows[0]["Data"]).size() == 2);

    q.where = {{ColumnRef{"t", "ID"}, CompareOp::Eq, Param{std::int64_t{2}}}};
    rows = execute(d.db, q);
    REQUIRE(rows.size() == 1);
    CHECK(std::holds_alternative<std::monostate>(rows[0]["Score"]));
}

TEST_CASE("manipulation: insert, upsert, update and delete") {
    DB d;
    d.exec("CREATE TABLE t (ID INTEGER PRIMARY KEY, Name TEXT, Note TEXT)");

    apply_writes(d.db, {{"t", TableWrite{WriteCommand::Insert, {},
                                         {{"ID", std::int64_t{1}}, {"Name", std::string("a")}}}}});
    CHECK(d.query_val("SELECT Name FROM t WHERE ID = 1") == "a");

    apply_writes(d.db, {{"t", TableWrite{WriteCommand::Upsert, {"ID"},
                                         {{"ID", std::int64_t{1}}, {"Name", std::string("b")}}}}});
    CHECK(d.count("t") == 1);
    CHECK(d.query_val("SELECT Name FROM t WHERE ID = 1") == "b");

    apply_writes(d.db, {{"t", TableWrite{WriteCommand::Update, {"ID"},
                                         {{"ID", std::int64_t{1}}, {"Note", std::string("n")}}}}});
    CHECK(d.query_val("SELECT Name || Note FROM t WHERE ID = 1") == "bn");

    apply_writes(d.db, {{"t", TableWrite{WriteCommand::Upsert, {"ID"},
                                         {{"ID", std::int64_t{2}}}}}});
    CHECK(d.count("t") == 2);

    apply_writes(d.db, {{"t", TableWrite{WriteCommand::Delete, {"ID"},
                                         {{"ID", std::int64_t{1}}}}}});
    CHECK(d.count("t") == 1);
    CHECK(d.query_int("SELECT ID FROM t") == 2);
}

TEST_CASE("manipulation: a mutable manipulation built up field by field") {
    DB d;
    d.exec("CREATE TABLE t (ID INTEGER PRIMARY KEY, Name TEXT)");
    d.exec("CREATE TABLE t_Localised (ID INTEGER PRIMARY KEY AUTOINCREMENT, "
           "RecordID INTEGER, Locale TEXT, Name TEXT, UNIQUE (RecordID, Locale))");

    Manipulation m;
    m["t"] = TableWrite{WriteCommand::Upsert, {"ID"}, {{"ID", std::int64_t{4}}}};
    m["t"].fields["Name"] = std::string("base");
    m["t_Localised"] = TableWrite{WriteCommand::Upsert, {"RecordID", "Locale"},
                                  {{"RecordID", std::int64_t{4}},
                                   {"Locale", std::string("fr_FR")},
                                   {"Name", std::string("nom")}}};
    apply_writes(d.db, m);

    CHECK(d.query_val("SELECT Name FROM t WHERE ID = 4") == "base");
    CHECK(d.query_val("SELECT Name FROM t_Localised WHERE RecordID = 4") == "nom");

    m["t_Localised"].fields["Name"] = std::string("titre");
    apply_writes(d.db, std::move(m));
    CHECK(d.count("t_Localised") == 1);
    CHECK(d.query_val("SELECT Name FROM t_Localised WHERE RecordID = 4") == "titre");
}

TEST_CASE("manipulation: writes without their key are refused") {
    DB d;
    d.exec("CREATE TABLE t (ID INTEGER PRIMARY KEY, Name TEXT)");
    d.exec("INSERT INTO t VALUES (1, 'a')");

    Manipulation unkeyed_delete{{"t", TableWrite{WriteCommand::Delete, {}, {}}}};
    CHECK_THROWS_AS(apply_writes(d.db, unkeyed_delete), Error);

    Manipulation missing_key{{"t", TableWrite{WriteCommand::Delete, {"ID"}, {}}}};
    CHECK_THROWS_AS(apply_writes(d.db, missing_key), Error);
    CHECK(d.count("t") == 1);
}

TEST_CASE("manipulation: sqlite failures surface as SqliteError") {
    DB d;
    Manipulation m{{"missing", TableWrite{WriteCommand::Insert, {},
                                          {{"ID", std::int64_t{1}}}}}};
    try {
        apply_writes(d.db, m);
        FAIL("expected an error");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::SqliteError);
    }
}
