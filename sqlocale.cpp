// Copyright 2026 The sqlocale Authors
// SPDX-License-Identifier: Apache-2.0
#include "sqlocale.h"

#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

// ── sqlite_util.h ───────────────────────────────────────────────
namespace sqlocale::detail {

/// RAII wrapper for sqlite3_stmt*.
class StmtGuard {
public:
    StmtGuard() = default;
    explicit StmtGuard(sqlite3_stmt* s) : stmt_(s) {}
    ~StmtGuard() { if (stmt_) sqlite3_finalize(stmt_); }

    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
    StmtGuard(StmtGuard&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }
    StmtGuard& operator=(StmtGuard&& o) noexcept {
        if (this != &o) {
            if (stmt_) sqlite3_finalize(stmt_);
            stmt_ = o.stmt_;
            o.stmt_ = nullptr;
        }
        return *this;
    }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/// Execute SQL or throw.
inline void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw Error(ErrorCode::SqliteError, msg);
    }
}

/// Prepare a statement or throw.
inline StmtGuard prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError,
                    std::string(sqlite3_errmsg(db)) + " in: " + sql);
    }
    return StmtGuard(stmt);
}

/// Step a statement expecting SQLITE_DONE, or throw.
inline void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
}

/// Step a statement; true on SQLITE_ROW, false on SQLITE_DONE, else throw.
inline bool step_row(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
}

/// Bind a Value to a 1-based parameter index or throw.
void bind_value(sqlite3* db, sqlite3_stmt* stmt, int index, const Value& value);

/// Bind values to parameters 1..n.
void bind_all(sqlite3* db, sqlite3_stmt* stmt, const std::vector<Value>& values);

/// Convert a sqlite3_value* to our Value variant.
Value to_value(sqlite3_value* val);

/// Read the current row of a statement into a Row.
Row read_row(sqlite3_stmt* stmt);

/// Exact-name table lookup.
bool table_exists(sqlite3* db, const std::string& table);

/// Case-insensitive table lookup returning the stored name.
std::optional<std::string> find_table_nocase(sqlite3* db,
                                             const std::string& table);

/// Column names of a table, in declaration order.
std::vector<std::string> table_columns(sqlite3* db, const std::string& table);

/// Storages a record type writes to: draft, plus live and versions if versioned.
std::vector<Storage> storages_of(const RecordType& type);

/// "?, ?, ?" for n placeholders.
std::string placeholders(std::size_t n);

/// RAII transaction. Rolls back unless commit() was called.
class TransactionGuard {
public:
    explicit TransactionGuard(sqlite3* db) : db_(db) { exec(db_, "BEGIN"); }
    ~TransactionGuard() {
        if (!db_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            SPDLOG_ERROR("rollback failed: {}", err ? err : "unknown error");
        }
        sqlite3_free(err);
    }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    void commit() {
        exec(db_, "COMMIT");
        db_ = nullptr;
    }

private:
    sqlite3* db_;
};

} // namespace sqlocale::detail

// ── sqlite_util.cpp ─────────────────────────────────────────────
namespace sqlocale::detail {

void bind_value(sqlite3* db, sqlite3_stmt* stmt, int index, const Value& value) {
    int rc = std::visit([&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, index);
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            return sqlite3_bind_int64(stmt, index, v);
        }
        else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, index, v.c_str(),
                                     static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        }
        else {
            if (v.empty()) return sqlite3_bind_zeroblob(stmt, index, 0);
            return sqlite3_bind_blob(stmt, index, v.data(),
                                     static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
}

void bind_all(sqlite3* db, sqlite3_stmt* stmt, const std::vector<Value>& values) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        bind_value(db, stmt, static_cast<int>(i + 1), values[i]);
    }
}

Value to_value(sqlite3_value* val) {
    if (!val) return std::monostate{};

    switch (sqlite3_value_type(val)) {
    case SQLITE_NULL:
        return std::monostate{};
    case SQLITE_INTEGER:
        return sqlite3_value_int64(val);
    case SQLITE_FLOAT:
        return sqlite3_value_double(val);
    case SQLITE_TEXT: {
        auto* text = reinterpret_cast<const char*>(sqlite3_value_text(val));
        int len = sqlite3_value_bytes(val);
        return std::string(text, static_cast<std::size_t>(len));
    }
    case SQLITE_BLOB: {
        auto* data = static_cast<const std::uint8_t*>(sqlite3_value_blob(val));
        int len = sqlite3_value_bytes(val);
        return std::vector<std::uint8_t>(data, data + len);
    }
    default:
        return std::monostate{};
    }
}

Row read_row(sqlite3_stmt* stmt) {
    Row row;
    int n = sqlite3_column_count(stmt);
    for (int i = 0; i < n; ++i) {
        row[sqlite3_column_name(stmt, i)] = to_value(sqlite3_column_value(stmt, i));
    }
    return row;
}

bool table_exists(sqlite3* db, const std::string& table) {
    auto stmt = prepare(db,
        "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
    bind_value(db, stmt.get(), 1, table);
    return step_row(db, stmt.get());
}

std::optional<std::string> find_table_nocase(sqlite3* db,
                                             const std::string& table) {
    auto stmt = prepare(db,
        "SELECT name FROM sqlite_master "
        "WHERE type='table' AND lower(name) = lower(?)");
    bind_value(db, stmt.get(), 1, table);
    if (!step_row(db, stmt.get())) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(
        sqlite3_column_text(stmt.get(), 0)));
}

std::vector<std::string> table_columns(sqlite3* db, const std::string& table) {
    std::string pragma = "PRAGMA table_info(" + quote_identifier(table) + ")";
    auto stmt = prepare(db, pragma.c_str());
    std::vector<std::string> columns;
    while (step_row(db, stmt.get())) {
        columns.emplace_back(reinterpret_cast<const char*>(
            sqlite3_column_text(stmt.get(), 1)));
    }
    return columns;
}

std::vector<Storage> storages_of(const RecordType& type) {
    if (!type.versioned) return {Storage::Draft};
    return {Storage::Draft, Storage::Live, Storage::Versions};
}

std::string placeholders(std::size_t n) {
    std::string out;
    for (std::size_t i = 0; i < n; ++i) {
        if (i) out += ", ";
        out += '?';
    }
    return out;
}

} // namespace sqlocale::detail

// ── locale.cpp ──────────────────────────────────────────────────
namespace sqlocale {

LocaleConfig::LocaleConfig(std::vector<Locale> locales)
    : locales_(std::move(locales)) {
    std::set<std::string> codes;
    int defaults = 0;
    for (const auto& l : locales_) {
        if (l.code.empty()) {
            throw Error(ErrorCode::ConfigurationError, "locale with empty code");
        }
        if (!codes.insert(l.code).second) {
            throw Error(ErrorCode::ConfigurationError,
                        "locale '" + l.code + "' configured twice");
        }
        if (l.is_default) ++defaults;
    }
    if (defaults > 1) {
        throw Error(ErrorCode::ConfigurationError,
                    "more than one default locale configured");
    }
    for (const auto& l : locales_) {
        for (const auto& f : l.fallbacks) {
            if (!codes.count(f)) {
                throw Error(ErrorCode::ConfigurationError,
                            "locale '" + l.code +
                            "' falls back to unknown locale '" + f + "'");
            }
        }
    }
}

void LocaleConfig::require_configured() const {
    if (locales_.empty()) {
        throw Error(ErrorCode::ConfigurationError, "no locales configured");
    }
    (void)default_locale();
}

const Locale& LocaleConfig::default_locale() const {
    for (const auto& l : locales_) {
        if (l.is_default) return l;
    }
    throw Error(ErrorCode::ConfigurationError, "no default locale configured");
}

const std::vector<Locale>& LocaleConfig::all() const {
    if (locales_.empty()) {
        throw Error(ErrorCode::ConfigurationError, "no locales configured");
    }
    return locales_;
}

const Locale* LocaleConfig::find(std::string_view code) const {
    for (const auto& l : locales_) {
        if (l.code == code) return &l;
    }
    return nullptr;
}

bool LocaleConfig::is_default(std::string_view code) const {
    const Locale* l = find(code);
    return l && l->is_default;
}

std::vector<const Locale*> LocaleConfig::resolve_chain(std::string_view code) const {
    const Locale* self = find(code);
    if (!self) {
        throw Error(ErrorCode::ConfigurationError,
                    "unknown locale '" + std::string(code) + "'");
    }

    std::vector<const Locale*> chain{self};
    for (const auto& f : self->fallbacks) {
        const Locale* next = find(f);
        if (next && std::find(chain.begin(), chain.end(), next) == chain.end()) {
            chain.push_back(next);
        }
    }
    return chain;
}

} // namespace sqlocale

// ── naming.cpp ──────────────────────────────────────────────────
namespace sqlocale {

std::string table_name(std::string_view table, Storage storage, bool localised) {
    std::string name(table);
    if (localised) name += kLocalisedSuffix;

    switch (storage) {
    case Storage::Draft:    break;
    case Storage::Live:     name += kLiveSuffix; break;
    case Storage::Versions: name += kVersionsSuffix; break;
    }
    return name;
}

std::string localised_alias(std::string_view table, std::string_view locale) {
    std::string alias(table);
    alias += kLocalisedSuffix;
    alias += '_';
    alias += locale;
    return alias;
}

std::string quote_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace sqlocale

// ── types_registry.cpp ──────────────────────────────────────────
namespace sqlocale {

const LocalisedTable* RecordType::find_table(std::string_view table) const {
    for (const auto& t : tables) {
        if (t.table == table) return &t;
    }
    return nullptr;
}

bool RecordType::is_localised_field(std::string_view table,
                                    std::string_view field) const {
    const LocalisedTable* t = find_table(table);
    return t && std::find(t->fields.begin(), t->fields.end(), field) != t->fields.end();
}

void TypeRegistry::add(RecordType type) {
    if (find(type.name)) {
        throw Error(ErrorCode::InvalidState,
                    "record type '" + type.name + "' registered twice");
    }
    if (type.tables.empty() || type.tables.front().table != type.base_table) {
        throw Error(ErrorCode::InvalidState,
                    "record type '" + type.name +
                    "' must list its base table first");
    }
    types_.push_back(std::move(type));
}

const RecordType& TypeRegistry::get(std::string_view name) const {
    if (const RecordType* t = find(name)) return *t;
    throw Error(ErrorCode::UnknownType,
                "unknown record type '" + std::string(name) + "'");
}

const RecordType* TypeRegistry::find(std::string_view name) const {
    for (const auto& t : types_) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

std::vector<const RecordType*> TypeRegistry::localised() const {
    std::vector<const RecordType*> out;
    for (const auto& t : types_) {
        if (t.localised) out.push_back(&t);
    }
    return out;
}

} // namespace sqlocale

// ── query.cpp ───────────────────────────────────────────────────
namespace sqlocale {

namespace {

const char* op_sql(CompareOp op) {
    switch (op) {
    case CompareOp::Eq: return " = ";
    case CompareOp::Ne: return " != ";
    case CompareOp::Lt: return " < ";
    case CompareOp::Le: return " <= ";
    case CompareOp::Gt: return " > ";
    case CompareOp::Ge: return " >= ";
    }
    throw Error(ErrorCode::InvalidState,
                "unknown comparison operator: " +
                std::to_string(static_cast<int>(op)));
}

class SqlWriter {
public:
    void column(const ColumnRef& c) {
        if (!c.table.empty()) {
            sql.text += quote_identifier(c.table);
            sql.text += '.';
        }
        sql.text += quote_identifier(c.column);
    }

    void expr(const Expr& e) {
        std::visit([&](const auto& x) {
            using T = std::decay_t<decltype(x)>;

            if constexpr (std::is_same_v<T, ColumnRef>) {
                column(x);
            }
            else if constexpr (std::is_same_v<T, Param>) {
                sql.text += '?';
                sql.params.push_back(x.value);
            }
            else if constexpr (std::is_same_v<T, LocalisedColumn>) {
                if (x.aliases.empty()) {
                    column(x.source);
                    return;
                }
                // First locale alias with a row wins, else the source column.
                sql.text += "CASE";
                for (const auto& alias : x.aliases) {
                    sql.text += " WHEN ";
                    column(ColumnRef{alias, "RecordID"});
                    sql.text += " IS NOT NULL THEN ";
                    column(ColumnRef{alias, x.source.column});
                }
                sql.text += " ELSE ";
                column(x.source);
                sql.text += " END";
            }
        }, e);
    }

    void condition(const Condition& c) {
        for (std::size_t i = 0; i < c.size(); ++i) {
            if (i) sql.text += " AND ";
            expr(c[i].lhs);
            sql.text += op_sql(c[i].op);
            expr(c[i].rhs);
        }
    }

    void table(const TableRef& t) {
        sql.text += quote_identifier(t.table);
        if (!t.alias.empty() && t.alias != t.table) {
            sql.text += " AS ";
            sql.text += quote_identifier(t.alias);
        }
    }

    Sql sql;
};

} // namespace

void SelectQuery::add_from(std::string table, std::string alias) {
    if (alias.empty()) alias = table;
    from.push_back(TableRef{std::move(table), std::move(alias),
                            JoinType::From, {}});
}

void SelectQuery::add_left_join(std::string table, std::string alias,
                                Condition on) {
    if (alias.empty()) alias = table;
    from.push_back(TableRef{std::move(table), std::move(alias),
                            JoinType::Left, std::move(on)});
}

TableRef* SelectQuery::find(std::string_view alias) {
    for (auto& t : from) {
        if (t.alias == alias) return &t;
    }
    return nullptr;
}

const TableRef* SelectQuery::find(std::string_view alias) const {
    for (const auto& t : from) {
        if (t.alias == alias) return &t;
    }
    return nullptr;
}

void SelectQuery::rename_table(std::string_view old_name, std::string_view new_name) {
    for (auto& t : from) {
        if (t.table == old_name) t.table = std::string(new_name);
    }
}

void SelectQuery::set_join_filter(std::string_view alias, Condition on) {
    TableRef* t = find(alias);
    if (!t) {
        throw Error(ErrorCode::InvalidState,
                    "no join aliased '" + std::string(alias) + "'");
    }
    t->on = std::move(on);
}

Sql SelectQuery::to_sql() const {
    if (from.empty()) {
        throw Error(ErrorCode::InvalidState, "query has no source table");
    }

    SqlWriter w;
    w.sql.text = "SELECT ";
    if (select.empty()) {
        w.sql.text += '*';
    }
    for (std::size_t i = 0; i < select.size(); ++i) {
        if (i) w.sql.text += ", ";
        w.expr(select[i].expr);
        std::string alias = select[i].alias;
        if (alias.empty()) {
            if (const auto* lc = std::get_if<LocalisedColumn>(&select[i].expr)) {
                alias = lc->source.column;
            }
        }
        if (!alias.empty()) {
            w.sql.text += " AS ";
            w.sql.text += quote_identifier(alias);
        }
    }

    w.sql.text += " FROM ";
    for (std::size_t i = 0; i < from.size(); ++i) {
        const TableRef& t = from[i];
        if (i == 0) {
            w.table(t);
            continue;
        }
        switch (t.join) {
        case JoinType::From:  w.sql.text += ", "; break;
        case JoinType::Inner: w.sql.text += " INNER JOIN "; break;
        case JoinType::Left:  w.sql.text += " LEFT JOIN "; break;
        }
        w.table(t);
        if (t.join != JoinType::From && !t.on.empty()) {
            w.sql.text += " ON ";
            w.condition(t.on);
        }
    }

    if (!where.empty()) {
        w.sql.text += " WHERE ";
        w.condition(where);
    }

    for (std::size_t i = 0; i < order_by.size(); ++i) {
        w.sql.text += i ? ", " : " ORDER BY ";
        w.expr(order_by[i].expr);
        if (order_by[i].descending) w.sql.text += " DESC";
    }

    return std::move(w.sql);
}

std::vector<Row> execute(sqlite3* db, const SelectQuery& query) {
    Sql sql = query.to_sql();
    SPDLOG_DEBUG("query: {}", sql.text);
    auto stmt = detail::prepare(db, sql.text.c_str());
    detail::bind_all(db, stmt.get(), sql.params);

    std::vector<Row> rows;
    while (detail::step_row(db, stmt.get())) {
        rows.push_back(detail::read_row(stmt.get()));
    }
    return rows;
}

} // namespace sqlocale

// ── manipulation.cpp ────────────────────────────────────────────
namespace sqlocale {

namespace {

const Value& key_value(const std::string& table, const TableWrite& write,
                       const std::string& column) {
    auto it = write.fields.find(column);
    if (it == write.fields.end()) {
        throw Error(ErrorCode::InvalidState,
                    "write to '" + table + "' is missing key column '" +
                    column + "'");
    }
    return it->second;
}

bool is_key(const TableWrite& write, const std::string& column) {
    return std::find(write.key.begin(), write.key.end(), column) != write.key.end();
}

void append_key_filter(Sql& sql, const std::string& table, const TableWrite& write) {
    sql.text += " WHERE ";
    for (std::size_t i = 0; i < write.key.size(); ++i) {
        if (i) sql.text += " AND ";
        sql.text += quote_identifier(write.key[i]) + " = ?";
        sql.params.push_back(key_value(table, write, write.key[i]));
    }
}

/// Returns an empty statement when there is nothing to do.
Sql write_sql(const std::string& table, const TableWrite& write) {
    Sql sql;

    switch (write.command) {
    case WriteCommand::Insert:
    case WriteCommand::Upsert: {
        if (write.command == WriteCommand::Upsert && write.key.empty()) {
            throw Error(ErrorCode::InvalidState,
                        "upsert into '" + table + "' has no key");
        }
        if (write.fields.empty()) {
            sql.text = "INSERT INTO " + quote_identifier(table) + " DEFAULT VALUES";
            return sql;
        }

        std::string columns;
        for (const auto& [column, value] : write.fields) {
            if (!columns.empty()) columns += ", ";
            columns += quote_identifier(column);
            sql.params.push_back(value);
        }
        sql.text = "INSERT INTO " + quote_identifier(table) + " (" + columns +
                   ") VALUES (" + detail::placeholders(write.fields.size()) + ")";

        if (write.command == WriteCommand::Upsert) {
            std::string target;
            for (const auto& k : write.key) {
                (void)key_value(table, write, k);
                if (!target.empty()) target += ", ";
                target += quote_identifier(k);
            }
            std::string updates;
            for (const auto& [column, value] : write.fields) {
                if (is_key(write, column)) continue;
                if (!updates.empty()) updates += ", ";
                updates += quote_identifier(column) + " = excluded." +
                           quote_identifier(column);
            }
            sql.text += " ON CONFLICT (" + target + ") DO ";
            sql.text += updates.empty() ? "NOTHING" : "UPDATE SET " + updates;
        }
        return sql;
    }
    case WriteCommand::Update: {
        if (write.key.empty()) {
            throw Error(ErrorCode::InvalidState,
                        "update of '" + table + "' has no key");
        }
        std::string updates;
        for (const auto& [column, value] : write.fields) {
            if (is_key(write, column)) continue;
            if (!updates.empty()) updates += ", ";
            updates += quote_identifier(column) + " = ?";
            sql.params.push_back(value);
        }
        if (updates.empty()) return Sql{};
        sql.text = "UPDATE " + quote_identifier(table) + " SET " + updates;
        append_key_filter(sql, table, write);
        return sql;
    }
    case WriteCommand::Delete: {
        // Never emit an unfiltered delete.
        if (write.key.empty()) {
            throw Error(ErrorCode::InvalidState,
                        "delete from '" + table + "' has no key");
        }
        sql.text = "DELETE FROM " + quote_identifier(table);
        append_key_filter(sql, table, write);
        return sql;
    }
    }
    throw Error(ErrorCode::InvalidState,
                "unknown write command for '" + table + "'");
}

} // namespace

void apply_writes(sqlite3* db, const Manipulation& manipulation) {
    for (const auto& [table, write] : manipulation) {
        Sql sql = write_sql(table, write);
        if (sql.text.empty()) continue;

        SPDLOG_DEBUG("write: {}", sql.text);
        auto stmt = detail::prepare(db, sql.text.c_str());
        detail::bind_all(db, stmt.get(), sql.params);
        detail::step_done(db, stmt.get());
    }
}

} // namespace sqlocale

// ── query_rewriter.cpp ──────────────────────────────────────────
namespace sqlocale {

VersioningMode parse_versioning_mode(std::string_view name) {
    if (name.empty())              return VersioningMode::None;
    if (name == "stage")           return VersioningMode::Stage;
    if (name == "stage_unique")    return VersioningMode::StageUnique;
    if (name == "archive")         return VersioningMode::Archive;
    if (name == "all_versions")    return VersioningMode::AllVersions;
    if (name == "latest_versions") return VersioningMode::LatestVersions;
    if (name == "version")         return VersioningMode::Version;
    throw Error(ErrorCode::UnsupportedVersioningMode,
                "bad versioning mode: " + std::string(name));
}

namespace {

/// The reference through which `table` is read: aliased as itself, or
/// under its draft, live or versions physical name.
const TableRef* find_source(const SelectQuery& query, std::string_view table) {
    if (const TableRef* t = query.find(table)) return t;
    for (const auto& t : query.from) {
        if (t.table == table ||
            t.table == table_name(table, Storage::Live) ||
            t.table == table_name(table, Storage::Versions)) {
            return &t;
        }
    }
    return nullptr;
}

void localise_expr(Expr& e, const LocalisedTable& table,
                   const std::string& source_alias,
                   const std::vector<std::string>& aliases) {
    if (auto* col = std::get_if<ColumnRef>(&e)) {
        if (col->table == source_alias &&
            std::find(table.fields.begin(), table.fields.end(), col->column) !=
                table.fields.end()) {
            e = LocalisedColumn{*col, aliases};
        }
    }
    else if (auto* lc = std::get_if<LocalisedColumn>(&e)) {
        if (lc->source.table == source_alias) lc->aliases = aliases;
    }
}

void localise_columns(SelectQuery& query, const LocalisedTable& table,
                      const std::string& source_alias,
                      const std::vector<std::string>& aliases) {
    for (auto& item : query.select) {
        localise_expr(item.expr, table, source_alias, aliases);
    }
    for (auto& c : query.where) {
        localise_expr(c.lhs, table, source_alias, aliases);
        localise_expr(c.rhs, table, source_alias, aliases);
    }
    for (auto& term : query.order_by) {
        localise_expr(term.expr, table, source_alias, aliases);
    }
}

} // namespace

void QueryRewriter::augment(SelectQuery& query, const RecordType& type,
                            const QueryParams& params, const Context& ctx) const {
    if (!ctx.locale || !type.localised) return;
    locales_.require_configured();

    const std::string& locale = *ctx.locale;
    localise_base(query, type, locale);

    if (!type.versioned) return;

    switch (params.mode) {
    case VersioningMode::None:
        return;

    // Reading a specific stage. Draft tables are already in place.
    case VersioningMode::Stage:
    case VersioningMode::StageUnique:
        if (params.stage != Stage::Draft) {
            rename_localised(query, type, Storage::Live);
        }
        return;

    case VersioningMode::Archive:
    case VersioningMode::AllVersions:
    case VersioningMode::LatestVersions:
    case VersioningMode::Version:
        rename_localised(query, type, Storage::Versions);
        add_fallback_chain(query, type, locale);
        return;
    }

    throw Error(ErrorCode::UnsupportedVersioningMode,
                "bad versioning mode: " +
                std::to_string(static_cast<int>(params.mode)));
}

void QueryRewriter::localise_base(SelectQuery& query, const RecordType& type,
                                  const std::string& locale) const {
    if (!locales_.find(locale)) {
        throw Error(ErrorCode::ConfigurationError,
                    "unknown locale '" + locale + "'");
    }

    for (const auto& lt : type.tables) {
        if (lt.fields.empty()) continue;
        const TableRef* source = find_source(query, lt.table);
        if (!source) continue;

        std::string source_alias = source->alias;
        std::string alias = localised_alias(lt.table, locale);
        if (!query.find(alias)) {
            query.add_left_join(
                table_name(lt.table, Storage::Draft, true), alias,
                {{ColumnRef{alias, "RecordID"}, CompareOp::Eq,
                  ColumnRef{source_alias, "ID"}},
                 {ColumnRef{alias, "Locale"}, CompareOp::Eq, Param{locale}}});
        }
        localise_columns(query, lt, source_alias, {alias});
    }
}

void QueryRewriter::rename_localised(SelectQuery& query, const RecordType& type,
                                     Storage storage) const {
    for (const auto& lt : type.tables) {
        if (lt.fields.empty()) continue;
        query.rename_table(table_name(lt.table, Storage::Draft, true),
                           table_name(lt.table, storage, true));
    }
}

void QueryRewriter::add_fallback_chain(SelectQuery& query, const RecordType& type,
                                       const std::string& locale) const {
    // Every localised join keys off the base table's version rows.
    std::string versions = table_name(type.base_table, Storage::Versions);
    if (const TableRef* base = find_source(query, type.base_table)) {
        versions = base->alias;
    }

    auto chain = locales_.resolve_chain(locale);

    for (const auto& lt : type.tables) {
        if (lt.fields.empty()) continue;
        const TableRef* source = find_source(query, lt.table);
        if (!source) continue;
        std::string source_alias = source->alias;

        std::vector<std::string> aliases;
        for (const Locale* link : chain) {
            std::string alias = localised_alias(lt.table, link->code);
            Condition on{
                {ColumnRef{versions, "RecordID"}, CompareOp::Eq,
                 ColumnRef{alias, "RecordID"}},
                {ColumnRef{alias, "Locale"}, CompareOp::Eq, Param{link->code}},
                {ColumnRef{alias, "Version"}, CompareOp::Eq,
                 ColumnRef{versions, "Version"}},
            };
            if (query.find(alias)) {
                query.set_join_filter(alias, std::move(on));
            } else {
                query.add_left_join(table_name(lt.table, Storage::Versions, true),
                                    alias, std::move(on));
            }
            aliases.push_back(std::move(alias));
        }
        localise_columns(query, lt, source_alias, aliases);
    }
}

} // namespace sqlocale

// ── write_rewriter.cpp ──────────────────────────────────────────
namespace sqlocale {

namespace {

/// Move the localised fields of one source table write into a write against
/// its localised table, keyed by (RecordID, Locale[, Version]).
void localise_table(Manipulation& manipulation, const LocalisedTable& lt,
                    Storage storage, const std::string& locale,
                    bool keep_in_source) {
    auto it = manipulation.find(table_name(lt.table, storage));
    if (it == manipulation.end()) return;
    TableWrite& source = it->second;
    if (source.command == WriteCommand::Delete) return;

    TableWrite target;
    for (const auto& field : lt.fields) {
        auto f = source.fields.find(field);
        if (f != source.fields.end()) target.fields[field] = f->second;
    }
    if (target.fields.empty()) return;

    const std::string id_column = storage == Storage::Versions ? "RecordID" : "ID";
    auto id = source.fields.find(id_column);
    if (id == source.fields.end()) {
        throw Error(ErrorCode::InvalidState,
                    "write to '" + it->first + "' has no " + id_column);
    }
    target.fields["RecordID"] = id->second;
    target.fields["Locale"] = locale;

    if (storage == Storage::Versions) {
        auto version = source.fields.find("Version");
        if (version == source.fields.end()) {
            throw Error(ErrorCode::InvalidState,
                        "write to '" + it->first + "' has no Version");
        }
        target.fields["Version"] = version->second;
        target.command = WriteCommand::Insert;
        target.key = {"RecordID", "Locale", "Version"};
    } else {
        target.command = WriteCommand::Upsert;
        target.key = {"RecordID", "Locale"};
    }

    // The source row keeps default-locale data only.
    if (!keep_in_source) {
        for (const auto& field : lt.fields) source.fields.erase(field);
    }

    manipulation[table_name(lt.table, storage, true)] = std::move(target);
}

} // namespace

void WriteRewriter::augment(Manipulation& manipulation, const RecordType& type,
                            const Context& ctx) const {
    if (!ctx.locale || !type.localised) return;
    locales_.require_configured();

    const std::string& locale = *ctx.locale;
    if (!locales_.find(locale)) {
        throw Error(ErrorCode::ConfigurationError,
                    "unknown locale '" + locale + "'");
    }
    bool keep_in_source = locales_.is_default(locale);

    for (const auto& lt : type.tables) {
        if (lt.fields.empty()) continue;
        for (Storage storage : detail::storages_of(type)) {
            localise_table(manipulation, lt, storage, locale, keep_in_source);
        }
    }
}

std::string WriteRewriter::delete_target(const RecordType& type,
                                         std::string_view table,
                                         const Context& ctx) const {
    // Deleting from live (unpublishing) targets live storage.
    if (type.versioned && ctx.stage == Stage::Live) {
        return table_name(table, Storage::Live, true);
    }
    return table_name(table, Storage::Draft, true);
}

Manipulation WriteRewriter::delete_targets(const RecordType& type, RecordId id,
                                           const Context& ctx) const {
    if (!ctx.locale) {
        throw Error(ErrorCode::InvalidState,
                    "deleting from a locale requires a locale");
    }
    locales_.require_configured();

    Manipulation manipulation;
    for (const auto& lt : type.tables) {
        if (lt.fields.empty()) continue;
        TableWrite write;
        write.command = WriteCommand::Delete;
        write.key = {"RecordID", "Locale"};
        write.fields["RecordID"] = id;
        write.fields["Locale"] = *ctx.locale;
        manipulation[delete_target(type, lt.table, ctx)] = std::move(write);
    }
    return manipulation;
}

} // namespace sqlocale

// ── existence_cache.cpp ─────────────────────────────────────────
namespace sqlocale {

struct ExistenceCache::Impl {
    sqlite3*    db;
    CacheConfig config;

    // "table/locale/id" -> exists.
    std::map<std::string, bool> memo;

    // (locale, table) -> every RecordID present. A miss here is a "no".
    std::map<std::pair<std::string, std::string>, std::set<RecordId>> loaded;

    /// Localised rows are written for the first table with localised fields,
    /// which is not always the base table.
    static const std::string* existence_table(const RecordType& type) {
        for (const auto& lt : type.tables) {
            if (!lt.fields.empty()) return &lt.table;
        }
        return nullptr;
    }

    bool prepopulates(const RecordType& type) const {
        const auto& types = config.prepopulate_types;
        return std::find(types.begin(), types.end(), type.name) != types.end();
    }

    std::set<RecordId> load_ids(const std::string& table, std::string_view locale) {
        std::string sql = "SELECT \"RecordID\" FROM " + quote_identifier(table) +
                          " WHERE \"Locale\" = ?";
        auto stmt = detail::prepare(db, sql.c_str());
        detail::bind_value(db, stmt.get(), 1, std::string(locale));

        std::set<RecordId> ids;
        while (detail::step_row(db, stmt.get())) {
            ids.insert(sqlite3_column_int64(stmt.get(), 0));
        }
        return ids;
    }

    bool query(const std::string& table, std::string_view locale, RecordId id) {
        std::string sql = "SELECT 1 FROM " + quote_identifier(table) +
                          " WHERE \"RecordID\" = ? AND \"Locale\" = ? LIMIT 1";
        auto stmt = detail::prepare(db, sql.c_str());
        sqlite3_bind_int64(stmt.get(), 1, id);
        detail::bind_value(db, stmt.get(), 2, std::string(locale));
        return detail::step_row(db, stmt.get());
    }
};

ExistenceCache::ExistenceCache(sqlite3* db, CacheConfig config)
    : impl_(std::make_unique<Impl>()) {
    impl_->db = db;
    impl_->config = std::move(config);
}

ExistenceCache::~ExistenceCache() = default;
ExistenceCache::ExistenceCache(ExistenceCache&&) noexcept = default;
ExistenceCache& ExistenceCache::operator=(ExistenceCache&&) noexcept = default;

bool ExistenceCache::is_in_stage(const RecordType& type, RecordId id,
                                 std::string_view locale, Stage stage) {
    if (stage == Stage::Live && !type.versioned) return false;

    const std::string* data_table = Impl::existence_table(type);
    if (!data_table) return false;

    if (impl_->prepopulates(type)) {
        prepopulate(type, locale);
    }

    std::string table = table_name(
        *data_table, stage == Stage::Live ? Storage::Live : Storage::Draft, true);

    auto loaded = impl_->loaded.find({std::string(locale), table});
    if (loaded != impl_->loaded.end()) {
        return loaded->second.count(id) > 0;
    }

    std::string key = table + "/" + std::string(locale) + "/" + std::to_string(id);
    auto memo = impl_->memo.find(key);
    if (memo != impl_->memo.end()) {
        return memo->second;
    }

    bool result = impl_->query(table, locale, id);
    impl_->memo.emplace(std::move(key), result);
    return result;
}

void ExistenceCache::prepopulate(const RecordType& type, std::string_view locale,
                                 bool draft, bool live) {
    const std::string* data_table = Impl::existence_table(type);
    if (!data_table) return;

    std::string table = table_name(*data_table, Storage::Draft, true);

    // Already been here.
    if (impl_->loaded.count({std::string(locale), table})) return;

    std::vector<std::string> tables;
    if (draft) tables.push_back(table);
    if (live && type.versioned) {
        tables.push_back(table_name(*data_table, Storage::Live, true));
    }

    for (const auto& t : tables) {
        auto ids = impl_->load_ids(t, locale);
        SPDLOG_DEBUG("prepopulated {} ids of {} in {}", ids.size(), t, locale);
        impl_->loaded[{std::string(locale), t}] = std::move(ids);
    }
}

void ExistenceCache::flush() {
    impl_->memo.clear();
    impl_->loaded.clear();
}

} // namespace sqlocale

// ── localiser.cpp ───────────────────────────────────────────────
namespace sqlocale {

struct Localiser::Impl {
    Impl(sqlite3* db, LocaleConfig l, TypeRegistry t, LocaliserConfig c)
        : db(db), locales(std::move(l)), types(std::move(t)),
          config(std::move(c)), queries(locales), writes(locales),
          cache(db, config.cache) {}

    sqlite3*        db;
    LocaleConfig    locales;
    TypeRegistry    types;
    LocaliserConfig config;
    QueryRewriter   queries;
    WriteRewriter   writes;
    ExistenceCache  cache;

    bool is_in_stage(std::string_view type, RecordId id, const Context& ctx,
                     const std::optional<std::string>& locale, Stage stage) {
        const std::optional<std::string>& code = locale ? locale : ctx.locale;
        // Potentially no locales exist yet.
        if (!code) return false;
        return cache.is_in_stage(types.get(type), id, *code, stage);
    }
};

Localiser::Localiser(sqlite3* db, LocaleConfig locales, TypeRegistry types,
                     LocaliserConfig config)
    : impl_(std::make_unique<Impl>(db, std::move(locales), std::move(types),
                                   std::move(config))) {}

Localiser::~Localiser() = default;
Localiser::Localiser(Localiser&&) noexcept = default;
Localiser& Localiser::operator=(Localiser&&) noexcept = default;

void Localiser::augment_query(SelectQuery& query, std::string_view type,
                              const QueryParams& params, const Context& ctx) const {
    impl_->queries.augment(query, impl_->types.get(type), params, ctx);
}

void Localiser::augment_write(Manipulation& manipulation, std::string_view type,
                              const Context& ctx) const {
    impl_->writes.augment(manipulation, impl_->types.get(type), ctx);
}

Manipulation Localiser::delete_targets(std::string_view type, RecordId id,
                                       const Context& ctx) const {
    return impl_->writes.delete_targets(impl_->types.get(type), id, ctx);
}

bool Localiser::is_drafted_in_locale(std::string_view type, RecordId id,
                                     const Context& ctx,
                                     std::optional<std::string> locale) {
    return impl_->is_in_stage(type, id, ctx, locale, Stage::Draft);
}

bool Localiser::is_published_in_locale(std::string_view type, RecordId id,
                                       const Context& ctx,
                                       std::optional<std::string> locale) {
    return impl_->is_in_stage(type, id, ctx, locale, Stage::Live);
}

bool Localiser::exists_in_locale(std::string_view type, RecordId id,
                                 const Context& ctx,
                                 std::optional<std::string> locale) {
    return is_drafted_in_locale(type, id, ctx, locale) ||
           is_published_in_locale(type, id, ctx, locale);
}

void Localiser::flush_cache() { impl_->cache.flush(); }

void Localiser::prepopulate(std::string_view type, std::string_view locale,
                            bool draft, bool live) {
    impl_->cache.prepopulate(impl_->types.get(type), locale, draft, live);
}

const LocaleConfig& Localiser::locales() const { return impl_->locales; }

const TypeRegistry& Localiser::types() const { return impl_->types; }

void ensure_localised_tables(sqlite3* db, const RecordType& type) {
    for (const auto& lt : type.tables) {
        if (lt.fields.empty()) continue;

        for (Storage storage : detail::storages_of(type)) {
            bool versions = storage == Storage::Versions;
            std::string sql =
                "CREATE TABLE IF NOT EXISTS " +
                quote_identifier(table_name(lt.table, storage, true)) + " (" +
                quote_identifier("ID") + " INTEGER PRIMARY KEY AUTOINCREMENT, " +
                quote_identifier("RecordID") + " INTEGER NOT NULL, " +
                quote_identifier("Locale") + " TEXT NOT NULL";
            if (versions) {
                sql += ", " + quote_identifier("Version") + " INTEGER NOT NULL";
            }
            for (const auto& field : lt.fields) {
                sql += ", " + quote_identifier(field);
            }
            sql += ", UNIQUE (" + quote_identifier("RecordID") + ", " +
                   quote_identifier("Locale");
            if (versions) sql += ", " + quote_identifier("Version");
            sql += "))";
            detail::exec(db, sql.c_str());
        }
    }
}

} // namespace sqlocale

// ── record_store.cpp ────────────────────────────────────────────
namespace sqlocale {

namespace {

Version next_version(sqlite3* db, const RecordType& type, RecordId id) {
    std::string sql = "SELECT MAX(\"Version\") FROM " +
                      quote_identifier(table_name(type.base_table, Storage::Versions)) +
                      " WHERE \"RecordID\" = ?";
    auto stmt = detail::prepare(db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (detail::step_row(db, stmt.get()) &&
        sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
        return sqlite3_column_int64(stmt.get(), 0) + 1;
    }
    return 1;
}

} // namespace

Record SqliteRecordStore::load(const RecordType& type, RecordId id) {
    Record record;
    record.type = &type;
    record.id = id;

    for (const auto& lt : type.tables) {
        std::string sql = "SELECT * FROM " + quote_identifier(lt.table) +
                          " WHERE \"ID\" = ?";
        auto stmt = detail::prepare(db_, sql.c_str());
        sqlite3_bind_int64(stmt.get(), 1, id);
        if (detail::step_row(db_, stmt.get())) {
            record.tables.emplace(lt.table, detail::read_row(stmt.get()));
        }
    }

    if (!record.tables.count(type.base_table)) {
        throw Error(ErrorCode::InvalidState,
                    "record " + std::to_string(id) + " not found in " +
                    type.base_table);
    }
    return record;
}

bool SqliteRecordStore::is_published(const Record& record) {
    if (!record.type->versioned) return false;

    std::string sql = "SELECT 1 FROM " +
                      quote_identifier(table_name(record.type->base_table, Storage::Live)) +
                      " WHERE \"ID\" = ? LIMIT 1";
    auto stmt = detail::prepare(db_, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, record.id);
    return detail::step_row(db_, stmt.get());
}

void SqliteRecordStore::write(const Record& record, const Context& ctx) {
    save(record, ctx, false);
}

bool SqliteRecordStore::publish(const Record& record, const Context& ctx) {
    if (!record.type->versioned) {
        throw Error(ErrorCode::InvalidState,
                    "record type '" + record.type->name + "' is not versioned");
    }
    save(record, ctx, true);
    return true;
}

void SqliteRecordStore::delete_from_locale(const Record& record, const Context& ctx) {
    apply_writes(db_, localiser_.delete_targets(record.type->name, record.id, ctx));
    localiser_.flush_cache();
}

void SqliteRecordStore::save(const Record& record, const Context& ctx, bool live) {
    const RecordType& type = *record.type;
    Version version = type.versioned ? next_version(db_, type, record.id) : 0;

    Manipulation manipulation;
    for (const auto& [table, row] : record.tables) {
        Row fields = row;
        fields["ID"] = record.id;
        if (type.versioned && (table == type.base_table || fields.count("Version"))) {
            fields["Version"] = version;
        }

        manipulation[table] = TableWrite{WriteCommand::Upsert, {"ID"}, fields};
        if (!type.versioned) continue;

        if (live) {
            manipulation[table_name(table, Storage::Live)] =
                TableWrite{WriteCommand::Upsert, {"ID"}, fields};
        }

        Row snapshot = std::move(fields);
        snapshot.erase("ID");
        snapshot["RecordID"] = record.id;
        snapshot["Version"] = version;
        manipulation[table_name(table, Storage::Versions)] =
            TableWrite{WriteCommand::Insert, {"RecordID", "Version"}, std::move(snapshot)};
    }

    localiser_.augment_write(manipulation, type.name, ctx);
    apply_writes(db_, manipulation);
    localiser_.flush_cache();

    SPDLOG_DEBUG("saved {} {} v{} in {}{}", type.name, record.id, version,
                 ctx.locale.value_or("(no locale)"), live ? " and published" : "");
}

} // namespace sqlocale

// ── migrator.cpp ────────────────────────────────────────────────
namespace sqlocale {

struct Migrator::Impl {
    Impl(sqlite3* db, Localiser& localiser, RecordStore& store,
         MigrationConfig config)
        : db(db), localiser(localiser), store(store),
          config(std::move(config)) {}

    sqlite3*        db;
    Localiser&      localiser;
    RecordStore&    store;
    MigrationConfig config;
    MigrationReport report;
    Context         ctx;

    struct Member {
        RecordId    id;
        std::string locale;
    };

    void migrate_all() {
        const std::string default_locale =
            localiser.locales().default_locale().code;

        auto types = localiser.types().localised();
        if (types.empty()) {
            SPDLOG_INFO("no localised record types, nothing to migrate");
            return;
        }
        for (const RecordType* type : types) {
            migrate_type(*type, default_locale);
        }
    }

    void migrate_type(const RecordType& type, const std::string& default_locale) {
        auto group_table = detail::find_table_nocase(
            db, type.base_table + "_translationgroups");
        if (!group_table) {
            SPDLOG_WARN("ignoring type {} without a _translationgroups table",
                        type.name);
            ++report.types_skipped;
            return;
        }

        auto columns = detail::table_columns(db, type.base_table);
        if (!has_column(columns, "Locale")) {
            SPDLOG_WARN("ignoring type {}: {} has no Locale column",
                        type.name, type.base_table);
            ++report.types_skipped;
            return;
        }

        SPDLOG_INFO("migrating {} from {}", type.name, *group_table);

        std::vector<RecordId> canonical_ids;
        for (RecordId group : group_ids(*group_table)) {
            auto item_ids = group_members(*group_table, group);
            auto members = load_members(type, columns, item_ids);
            if (members.empty()) {
                SPDLOG_INFO("group {} has no usable members, skipping", group);
                continue;
            }
            ++report.groups;

            RecordId canonical = members.front().id;
            for (const auto& m : members) {
                if (m.locale == default_locale) {
                    canonical = m.id;
                    break;
                }
            }
            SPDLOG_INFO("group {}: {} members, canonical record {}",
                        group, members.size(), canonical);

            for (const auto& member : members) {
                replay(type, member, canonical);
            }
            repoint(type, item_ids, canonical);
            canonical_ids.push_back(canonical);
        }

        prune(type, default_locale, canonical_ids);

        drop_locale_indexes(type.base_table);
        SPDLOG_INFO("dropping Locale column from {}", type.base_table);
        detail::exec(db, ("ALTER TABLE " + quote_identifier(type.base_table) +
                          " DROP COLUMN \"Locale\"").c_str());

        SPDLOG_INFO("dropping legacy table {}", *group_table);
        detail::exec(db, ("DROP TABLE IF EXISTS " +
                          quote_identifier(*group_table)).c_str());

        ++report.types_migrated;
    }

    /// SQLite refuses to drop a column that an index still covers.
    void drop_locale_indexes(const std::string& table) {
        std::vector<std::string> doomed;
        {
            std::string sql = "SELECT il.name FROM pragma_index_list(?) AS il "
                              "WHERE il.origin = 'c' AND EXISTS ("
                              "  SELECT 1 FROM pragma_index_info(il.name) AS ii "
                              "  WHERE ii.name = 'Locale' COLLATE NOCASE)";
            auto stmt = detail::prepare(db, sql.c_str());
            detail::bind_value(db, stmt.get(), 1, table);
            while (detail::step_row(db, stmt.get())) {
                doomed.emplace_back(reinterpret_cast<const char*>(
                    sqlite3_column_text(stmt.get(), 0)));
            }
        }
        for (const auto& index : doomed) {
            SPDLOG_INFO("dropping index {} on {}.Locale", index, table);
            detail::exec(db, ("DROP INDEX IF EXISTS " +
                              quote_identifier(index)).c_str());
        }
    }

    static bool has_column(const std::vector<std::string>& columns,
                           const char* name) {
        return std::find(columns.begin(), columns.end(), name) != columns.end();
    }

    std::vector<RecordId> group_ids(const std::string& group_table) {
        std::string sql = "SELECT DISTINCT \"TranslationGroupID\" FROM " +
                          quote_identifier(group_table) +
                          " ORDER BY \"TranslationGroupID\"";
        auto stmt = detail::prepare(db, sql.c_str());
        std::vector<RecordId> ids;
        while (detail::step_row(db, stmt.get())) {
            ids.push_back(sqlite3_column_int64(stmt.get(), 0));
        }
        return ids;
    }

    std::vector<RecordId> group_members(const std::string& group_table,
                                        RecordId group) {
        std::string sql = "SELECT \"OriginalID\" FROM " +
                          quote_identifier(group_table) +
                          " WHERE \"TranslationGroupID\" = ?";
        auto stmt = detail::prepare(db, sql.c_str());
        sqlite3_bind_int64(stmt.get(), 1, group);
        std::vector<RecordId> ids;
        while (detail::step_row(db, stmt.get())) {
            ids.push_back(sqlite3_column_int64(stmt.get(), 0));
        }
        return ids;
    }

    /// Group members keyed by legacy locale, in creation order. A later
    /// member with the same locale replaces an earlier one in place.
    std::vector<Member> load_members(const RecordType& type,
                                     const std::vector<std::string>& columns,
                                     const std::vector<RecordId>& item_ids) {
        if (item_ids.empty()) return {};

        bool has_class = has_column(columns, "ClassName");
        std::string sql = "SELECT \"ID\", \"Locale\"";
        if (has_class) sql += ", \"ClassName\"";
        // Read Locale from the base table itself; the values here are legacy.
        sql += " FROM " + quote_identifier(type.base_table) +
               " WHERE \"ID\" IN (" + detail::placeholders(item_ids.size()) + ")";
        sql += has_column(columns, "Created") ? " ORDER BY \"Created\", \"ID\""
                                              : " ORDER BY \"ID\"";

        auto stmt = detail::prepare(db, sql.c_str());
        for (std::size_t i = 0; i < item_ids.size(); ++i) {
            sqlite3_bind_int64(stmt.get(), static_cast<int>(i + 1), item_ids[i]);
        }

        std::vector<Member> members;
        while (detail::step_row(db, stmt.get())) {
            RecordId id = sqlite3_column_int64(stmt.get(), 0);
            auto* locale = reinterpret_cast<const char*>(
                sqlite3_column_text(stmt.get(), 1));
            if (!locale || !*locale) {
                SPDLOG_WARN("skipping {} {}: couldn't find Locale", type.name, id);
                ++report.records_skipped;
                continue;
            }

            if (!localiser.locales().find(locale)) {
                SPDLOG_WARN("skipping {} {}: locale {} is not configured",
                            type.name, id, locale);
                ++report.records_skipped;
                continue;
            }

            if (has_class && is_obsolete(type, stmt.get(), 2)) {
                SPDLOG_WARN("skipping {} {}: obsolete class", type.name, id);
                ++report.records_skipped;
                continue;
            }

            auto existing = std::find_if(members.begin(), members.end(),
                [&](const Member& m) { return m.locale == locale; });
            if (existing != members.end()) {
                existing->id = id;
            } else {
                members.push_back(Member{id, locale});
            }
        }
        return members;
    }

    static bool is_obsolete(const RecordType& type, sqlite3_stmt* stmt, int col) {
        if (type.class_names.empty()) return false;
        auto* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        if (!name) return true;
        return std::find(type.class_names.begin(), type.class_names.end(),
                         name) == type.class_names.end();
    }

    /// Save a member's localised data onto the canonical record, so its
    /// localised version rows line up with the canonical's base versions.
    void replay(const RecordType& type, const Member& member, RecordId canonical) {
        Record source = store.load(type, member.id);
        bool published = store.is_published(source);
        SPDLOG_INFO("updating {} {} [RecordID: {}] with locale {}",
                    type.name, member.id, canonical, member.locale);

        Record record = member.id == canonical ? std::move(source)
                                               : store.load(type, canonical);
        if (member.id != canonical) {
            for (const auto& lt : type.tables) {
                auto from = source.tables.find(lt.table);
                if (from == source.tables.end()) continue;

                auto to = record.tables.find(lt.table);
                if (to == record.tables.end()) {
                    record.tables.emplace(lt.table, from->second);
                    continue;
                }
                for (const auto& field : lt.fields) {
                    auto value = from->second.find(field);
                    if (value != from->second.end()) to->second[field] = value->second;
                }
            }
        }

        with_locale(ctx, member.locale, [&] {
            if (!published) {
                store.write(record, ctx);
                SPDLOG_INFO("  -- saved to draft");
            } else if (!store.publish(record, ctx)) {
                SPDLOG_ERROR("  -- publishing FAILED");
                throw Error(ErrorCode::PublishFailure,
                            "failed to publish " + type.name + " " +
                            std::to_string(member.id) + " in " + member.locale);
            } else {
                SPDLOG_INFO("  -- published");
            }
        });
        ++report.records_replayed;
    }

    void repoint(const RecordType& type, const std::vector<RecordId>& item_ids,
                 RecordId canonical) {
        std::vector<RecordId> others;
        for (RecordId id : item_ids) {
            if (id != canonical) others.push_back(id);
        }
        if (others.empty()) return;

        for (const auto& lt : type.tables) {
            if (lt.fields.empty()) continue;
            for (Storage storage : detail::storages_of(type)) {
                std::string table = table_name(lt.table, storage, true);
                if (!detail::table_exists(db, table)) continue;

                std::string sql = "UPDATE " + quote_identifier(table) +
                                  " SET \"RecordID\" = ? WHERE \"RecordID\" IN (" +
                                  detail::placeholders(others.size()) + ")";
                SPDLOG_INFO("repointing {} records in {} to {}",
                            others.size(), table, canonical);
                auto stmt = detail::prepare(db, sql.c_str());
                sqlite3_bind_int64(stmt.get(), 1, canonical);
                for (std::size_t i = 0; i < others.size(); ++i) {
                    sqlite3_bind_int64(stmt.get(), static_cast<int>(i + 2), others[i]);
                }
                detail::step_done(db, stmt.get());
            }
        }
    }

    /// Delete every record whose legacy locale isn't the default, except the
    /// canonical records, from all data tables of the type.
    void prune(const RecordType& type, const std::string& default_locale,
               const std::vector<RecordId>& canonical_ids) {
        std::set<RecordId> keep(canonical_ids.begin(), canonical_ids.end());
        std::set<RecordId> doomed;

        for (Storage storage : detail::storages_of(type)) {
            std::string table = table_name(type.base_table, storage);
            if (!detail::table_exists(db, table)) continue;
            if (!has_column(detail::table_columns(db, table), "Locale")) continue;

            const char* id_column = storage == Storage::Versions ? "RecordID" : "ID";
            std::string sql = "SELECT DISTINCT " + quote_identifier(id_column) +
                              " FROM " + quote_identifier(table) +
                              " WHERE \"Locale\" != ?";
            auto stmt = detail::prepare(db, sql.c_str());
            detail::bind_value(db, stmt.get(), 1, default_locale);
            while (detail::step_row(db, stmt.get())) {
                RecordId id = sqlite3_column_int64(stmt.get(), 0);
                if (!keep.count(id)) doomed.insert(id);
            }
        }
        if (doomed.empty()) return;

        detail::exec(db,
            "CREATE TEMP TABLE IF NOT EXISTS _sqlocale_prune ("
            "  ID INTEGER PRIMARY KEY"
            ")");
        detail::exec(db, "DELETE FROM temp._sqlocale_prune");
        {
            auto stmt = detail::prepare(db,
                "INSERT INTO temp._sqlocale_prune (ID) VALUES (?)");
            for (RecordId id : doomed) {
                sqlite3_reset(stmt.get());
                sqlite3_bind_int64(stmt.get(), 1, id);
                detail::step_done(db, stmt.get());
            }
        }

        for (const auto& lt : type.tables) {
            for (Storage storage : detail::storages_of(type)) {
                std::string table = table_name(lt.table, storage);
                if (!detail::table_exists(db, table)) continue;

                const char* id_column = storage == Storage::Versions ? "RecordID" : "ID";
                std::string sql = "DELETE FROM " + quote_identifier(table) +
                                  " WHERE " + quote_identifier(id_column) +
                                  " IN (SELECT ID FROM temp._sqlocale_prune)";
                SPDLOG_INFO("pruning {} records not in {} from {}",
                            doomed.size(), default_locale, table);
                detail::exec(db, sql.c_str());
            }
        }

        detail::exec(db, "DROP TABLE temp._sqlocale_prune");
    }
};

Migrator::Migrator(sqlite3* db, Localiser& localiser, RecordStore& store,
                   MigrationConfig config)
    : impl_(std::make_unique<Impl>(db, localiser, store, std::move(config))) {}

Migrator::~Migrator() = default;

MigrationReport Migrator::run() {
    // Refuse before any mutation.
    impl_->localiser.locales().require_configured();
    impl_->report = MigrationReport{};

    std::function<void()> body = [this] { impl_->migrate_all(); };
    std::function<void()> transactional = [&] {
        if (impl_->config.transaction) {
            impl_->config.transaction(body);
            return;
        }
        detail::TransactionGuard txn(impl_->db);
        body();
        txn.commit();
    };

    try {
        if (impl_->config.privileged) {
            impl_->config.privileged(transactional);
        } else {
            transactional();
        }
    } catch (const std::exception& e) {
        // Drop answers about rolled-back rows.
        impl_->localiser.flush_cache();
        SPDLOG_ERROR("migration aborted: {}", e.what());
        throw;
    } catch (...) {
        impl_->localiser.flush_cache();
        SPDLOG_ERROR("migration aborted");
        throw;
    }

    impl_->localiser.flush_cache();
    SPDLOG_INFO("migration complete: {} types migrated, {} skipped, {} groups, "
                "{} records replayed, {} skipped",
                impl_->report.types_migrated, impl_->report.types_skipped,
                impl_->report.groups, impl_->report.records_replayed,
                impl_->report.records_skipped);
    return impl_->report;
}

} // namespace sqlocale
