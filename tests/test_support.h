// Copyright 2026 The sqlocale Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <sqlocale.h>

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace sqlocale::test {

struct DB {
    sqlite3* db = nullptr;
    DB() { sqlite3_open(":memory:", &db); }
    ~DB() { if (db) sqlite3_close(db); }
    DB(const DB&) = delete;
    DB& operator=(const DB&) = delete;

    void exec(const std::string& sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "error";
            sqlite3_free(err);
            throw std::runtime_error(msg);
        }
    }

    int count(const std::string& table) {
        return static_cast<int>(query_int("SELECT COUNT(*) FROM " + table));
    }

    std::int64_t query_int(const std::string& sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(sqlite3_errmsg(db));
        }
        std::int64_t v = -1;
        if (sqlite3_step(stmt) == SQLITE_ROW) v = sqlite3_column_int64(stmt, 0);
        sqlite3_finalize(stmt);
        return v;
    }

    /// First column of the first row as text, or "<null>".
    std::string query_val(const std::string& sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(sqlite3_errmsg(db));
        }
        std::string v = "<none>";
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            auto* text = sqlite3_column_text(stmt, 0);
            v = text ? reinterpret_cast<const char*>(text) : "<null>";
        }
        sqlite3_finalize(stmt);
        return v;
    }

    /// Every row of every table, in a stable order.
    std::string dump() {
        std::string out;
        sqlite3_stmt* tables = nullptr;
        sqlite3_prepare_v2(db,
            "SELECT name FROM sqlite_master WHERE type='table' "
            "AND name NOT LIKE 'sqlite_%' ORDER BY name", -1, &tables, nullptr);
        while (sqlite3_step(tables) == SQLITE_ROW) {
            std::string name = reinterpret_cast<const char*>(
                sqlite3_column_text(tables, 0));
            out += "[" + name + "]\n";

            sqlite3_stmt* rows = nullptr;
            std::string sql = "SELECT * FROM " + quote_identifier(name) + " ORDER BY 1";
            sqlite3_prepare_v2(db, sql.c_str(), -1, &rows, nullptr);
            int n = sqlite3_column_count(rows);
            for (int i = 0; i < n; ++i) {
                out += sqlite3_column_name(rows, i);
                out += i + 1 < n ? "|" : "\n";
            }
            while (sqlite3_step(rows) == SQLITE_ROW) {
                for (int i = 0; i < n; ++i) {
                    auto* text = sqlite3_column_text(rows, i);
                    out += text ? reinterpret_cast<const char*>(text) : "NULL";
                    out += i + 1 < n ? "|" : "\n";
                }
            }
            sqlite3_finalize(rows);
        }
        sqlite3_finalize(tables);
        return out;
    }
};

inline LocaleConfig three_locales() {
    return LocaleConfig({
        {"en_NZ", "English", {}, true},
        {"fr_FR", "French", {}, false},
        {"de_DE", "German", {}, false},
    });
}

/// Versioned "Page" type over SiteTree with localised Title and Content.
inline RecordType page_type() {
    RecordType t;
    t.name = "Page";
    t.base_table = "SiteTree";
    t.tables = {{"SiteTree", {"Title", "Content"}}};
    t.class_names = {"Page"};
    return t;
}

inline void create_site_tree(DB& d, bool legacy_locale = false) {
    std::string locale = legacy_locale ? ", Locale TEXT" : "";
    d.exec("CREATE TABLE SiteTree (ID INTEGER PRIMARY KEY, ClassName TEXT, "
           "Created TEXT, Version INTEGER, Title TEXT, Content TEXT" + locale + ")");
    d.exec("CREATE TABLE SiteTree_Live (ID INTEGER PRIMARY KEY, ClassName TEXT, "
           "Created TEXT, Version INTEGER, Title TEXT, Content TEXT" + locale + ")");
    d.exec("CREATE TABLE SiteTree_Versions (ID INTEGER PRIMARY KEY AUTOINCREMENT, "
           "RecordID INTEGER, Version INTEGER, ClassName TEXT, Created TEXT, "
           "Title TEXT, Content TEXT" + locale + ", UNIQUE (RecordID, Version))");
}

inline TypeRegistry page_registry() {
    TypeRegistry types;
    types.add(page_type());
    return types;
}

/// A database holding Page records, with a localiser and record store over it.
struct Site {
    DB                d;
    Localiser         localiser;
    SqliteRecordStore store;
    Context           ctx;

    explicit Site(LocaleConfig locales = three_locales(),
                  LocaliserConfig config = {}, bool legacy_locale = false)
        : localiser(d.db, std::move(locales), page_registry(), std::move(config)),
          store(d.db, localiser) {
        create_site_tree(d, legacy_locale);
        ensure_localised_tables(d.db, type());
    }

    const RecordType& type() const { return localiser.types().get("Page"); }

    Record page(RecordId id, const std::string& title,
                const std::string& content = "") const {
        Record r;
        r.type = &type();
        r.id = id;
        r.tables["SiteTree"] = Row{
            {"ClassName", std::string("Page")},
            {"Title", title},
            {"Content", content},
        };
        return r;
    }

    void write(const std::string& locale, const Record& r) {
        with_locale(ctx, locale, [&] { store.write(r, ctx); });
    }

    void publish(const std::string& locale, const Record& r) {
        with_locale(ctx, locale, [&] { store.publish(r, ctx); });
    }

    /// Title of record `id` as read in `locale`.
    std::string read_title(const std::string& locale, RecordId id,
                           QueryParams params = {}) {
        SelectQuery q;
        q.add_from(params.stage == Stage::Live ? "SiteTree_Live" : "SiteTree",
                   "SiteTree");
        q.select = {{ColumnRef{"SiteTree", "Title"}, ""}};
        q.where = {{ColumnRef{"SiteTree", "ID"}, CompareOp::Eq, Param{id}}};
        with_locale(ctx, locale, [&] {
            localiser.augment_query(q, "Page", params, ctx);
        });
        auto rows = execute(d.db, q);
        if (rows.empty()) return "<none>";
        const auto* title = std::get_if<std::string>(&rows[0]["Title"]);
        return title ? *title : "<null>";
    }
};

} // namespace sqlocale::test
