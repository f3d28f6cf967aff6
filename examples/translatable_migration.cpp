// Copyright 2026 The sqlocale Authors
// SPDX-License-Identifier: Apache-2.0
#include <sqlocale.h>

#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <cstdio>
#include <string>
#include <vector>

using namespace sqlocale;

static void print_titles(sqlite3* db, Localiser& localiser, RecordId id,
                         const std::vector<std::string>& locales, Stage stage) {
    Context ctx;
    for (const auto& code : locales) {
        SelectQuery q;
        q.add_from(stage == Stage::Live ? "SiteTree_Live" : "SiteTree", "SiteTree");
        q.select = {{ColumnRef{"SiteTree", "Title"}, ""}};
        q.where = {{ColumnRef{"SiteTree", "ID"}, CompareOp::Eq, Param{id}}};

        with_locale(ctx, code, [&] {
            localiser.augment_query(q, "Page", {VersioningMode::Stage, stage}, ctx);
        });

        auto rows = execute(db, q);
        const std::string* title = rows.empty()
            ? nullptr : std::get_if<std::string>(&rows[0]["Title"]);
        std::printf("  %-6s %s\n", code.c_str(), title ? title->c_str() : "(none)");
    }
}

int main() {
    spdlog::set_level(spdlog::level::info);

    sqlite3* db = nullptr;
    sqlite3_open(":memory:", &db);

    // A site where every translation was its own page.
    const char* schema =
        "CREATE TABLE SiteTree (ID INTEGER PRIMARY KEY, ClassName TEXT, "
        "  Created TEXT, Version INTEGER, Title TEXT, Content TEXT, Locale TEXT);"
        "CREATE TABLE SiteTree_Live (ID INTEGER PRIMARY KEY, ClassName TEXT, "
        "  Created TEXT, Version INTEGER, Title TEXT, Content TEXT, Locale TEXT);"
        "CREATE TABLE SiteTree_Versions (ID INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  RecordID INTEGER, Version INTEGER, ClassName TEXT, Created TEXT, "
        "  Title TEXT, Content TEXT, Locale TEXT, UNIQUE (RecordID, Version));"
        "CREATE TABLE SiteTree_translationgroups (ID INTEGER PRIMARY KEY, "
        "  OriginalID INTEGER, TranslationGroupID INTEGER);"
        "INSERT INTO SiteTree VALUES "
        "  (1, 'Page', '2020-01-01', 1, 'Home', 'Welcome', 'en_NZ'),"
        "  (2, 'Page', '2020-01-02', 1, 'Accueil', 'Bienvenue', 'fr_FR'),"
        "  (3, 'Page', '2020-01-03', 1, 'Startseite', 'Willkommen', 'de_DE');"
        "INSERT INTO SiteTree_Live SELECT * FROM SiteTree WHERE ID IN (1, 3);"
        "INSERT INTO SiteTree_Versions (RecordID, Version, ClassName, Created, "
        "  Title, Content, Locale) "
        "  SELECT ID, Version, ClassName, Created, Title, Content, Locale FROM SiteTree;"
        "INSERT INTO SiteTree_translationgroups (OriginalID, TranslationGroupID) "
        "  VALUES (1, 1), (2, 1), (3, 1);";
    char* err = nullptr;
    if (sqlite3_exec(db, schema, nullptr, nullptr, &err) != SQLITE_OK) {
        SPDLOG_ERROR("schema: {}", err ? err : "unknown error");
        sqlite3_free(err);
        sqlite3_close(db);
        return 1;
    }

    RecordType page;
    page.name = "Page";
    page.base_table = "SiteTree";
    page.tables = {{"SiteTree", {"Title", "Content"}}};
    page.class_names = {"Page"};

    TypeRegistry types;
    types.add(page);

    std::vector<std::string> codes = {"en_NZ", "fr_FR", "de_DE"};
    LocaleConfig locales({
        {"en_NZ", "English (New Zealand)", {}, true},
        {"fr_FR", "French", {"en_NZ"}, false},
        {"de_DE", "German", {"en_NZ"}, false},
    });

    try {
        Localiser localiser(db, std::move(locales), std::move(types));
        ensure_localised_tables(db, localiser.types().get("Page"));
        SqliteRecordStore store(db, localiser);

        std::printf("=== Migrate ===\n");
        Migrator migrator(db, localiser, store);
        MigrationReport report = migrator.run();
        std::printf("Types migrated=%zu, groups=%zu, records replayed=%zu\n\n",
                    report.types_migrated, report.groups, report.records_replayed);

        std::printf("=== Draft titles of page 1 ===\n");
        print_titles(db, localiser, 1, codes, Stage::Draft);

        std::printf("\n=== Live titles of page 1 ===\n");
        print_titles(db, localiser, 1, codes, Stage::Live);
    } catch (const Error& e) {
        SPDLOG_ERROR("{}", e.what());
        sqlite3_close(db);
        return 1;
    }

    sqlite3_close(db);
    return 0;
}
