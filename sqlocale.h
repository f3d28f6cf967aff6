// Copyright 2026 The sqlocale Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// ── types.h ─────────────────────────────────────────────────────
namespace sqlocale {

/// Stable numeric identity of a record within its base table.
using RecordId = std::int64_t;

/// Monotonically increasing version number of a versioned record.
using Version = std::int64_t;

/// Column value. Uses std::variant to represent SQLite types.
using Value = std::variant<
    std::monostate,            // NULL
    std::int64_t,              // INTEGER
    double,                    // REAL
    std::string,               // TEXT
    std::vector<std::uint8_t>  // BLOB
>;

/// A single row, keyed by column name.
using Row = std::map<std::string, Value>;

/// Lifecycle stage of a record.
enum class Stage : std::uint8_t {
    Draft,
    Live,
};

/// Physical storage a table name can refer to.
enum class Storage : std::uint8_t {
    Draft,     ///< Unsuffixed table.
    Live,      ///< `_Live` suffixed table.
    Versions,  ///< `_Versions` suffixed table.
};

} // namespace sqlocale

// ── error.h ─────────────────────────────────────────────────────
namespace sqlocale {

/// Error codes returned by sqlocale operations.
enum class ErrorCode : int {
    Ok = 0,
    SqliteError,                ///< An underlying SQLite call failed.
    ConfigurationError,         ///< No locales, no default locale, or bad locale data.
    UnsupportedVersioningMode,  ///< A query carried a versioning mode we don't know.
    PublishFailure,             ///< Publishing a record during migration failed.
    InvalidState,               ///< Operation not valid for the given data.
    UnknownType,                ///< Record type is not registered.
};

/// Exception thrown by sqlocale operations.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace sqlocale

// ── locale.h ────────────────────────────────────────────────────
namespace sqlocale {

/// A translation target and its configured fallbacks.
struct Locale {
    std::string              code;       ///< e.g. "en_NZ".
    std::string              title;
    std::vector<std::string> fallbacks;  ///< Consulted in order after `code`.
    bool                     is_default = false;
};

/// Immutable set of configured locales.
///
/// Construction rejects duplicate codes, more than one default and fallbacks
/// naming unknown locales. An empty set, or one without a default, is legal to
/// hold but every accessor that needs either throws ConfigurationError.
class LocaleConfig {
public:
    LocaleConfig() = default;
    explicit LocaleConfig(std::vector<Locale> locales);

    /// Throws ConfigurationError unless at least one locale and a default exist.
    void require_configured() const;

    const Locale& default_locale() const;
    const std::vector<Locale>& all() const;

    const Locale* find(std::string_view code) const;
    bool is_default(std::string_view code) const;

    /// The locale itself first, then its fallbacks in configured order.
    /// Duplicates are dropped. Fallbacks are not followed transitively, so
    /// every chain is finite.
    std::vector<const Locale*> resolve_chain(std::string_view code) const;

private:
    std::vector<Locale> locales_;
};

/// Per-operation state consulted by the rewriters.
struct Context {
    std::optional<std::string> locale;  ///< Unset: non-localised read/write.
    Stage                      stage = Stage::Draft;
};

namespace detail {

/// Restores a Context to its saved value on destruction.
class ContextGuard {
public:
    explicit ContextGuard(Context& ctx) : ctx_(ctx), saved_(ctx) {}
    ~ContextGuard() { ctx_ = std::move(saved_); }

    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

private:
    Context& ctx_;
    Context  saved_;
};

} // namespace detail

/// Run fn with ctx.locale set to `locale`. The previous context is restored
/// on every exit path, including exceptions.
template <typename Fn>
decltype(auto) with_locale(Context& ctx, std::string locale, Fn&& fn) {
    detail::ContextGuard guard(ctx);
    ctx.locale = std::move(locale);
    return std::forward<Fn>(fn)();
}

/// Run fn with ctx.stage set to `stage`, restoring it afterwards.
template <typename Fn>
decltype(auto) with_stage(Context& ctx, Stage stage, Fn&& fn) {
    detail::ContextGuard guard(ctx);
    ctx.stage = stage;
    return std::forward<Fn>(fn)();
}

} // namespace sqlocale

// ── naming.h ────────────────────────────────────────────────────
namespace sqlocale {

inline constexpr std::string_view kLiveSuffix      = "_Live";
inline constexpr std::string_view kVersionsSuffix  = "_Versions";
inline constexpr std::string_view kLocalisedSuffix = "_Localised";

/// Physical table for (table, storage). Localised tables carry the
/// `_Localised` suffix before the storage suffix; base tables never do.
std::string table_name(std::string_view table, Storage storage,
                       bool localised = false);

/// Alias under which the localised rows of `table` for `locale` are joined.
std::string localised_alias(std::string_view table, std::string_view locale);

/// Quote an SQL identifier. Every identifier sqlocale emits passes through here.
std::string quote_identifier(std::string_view name);

} // namespace sqlocale

// ── types_registry.h ────────────────────────────────────────────
namespace sqlocale {

/// One data table of a record type and the fields it stores per locale.
struct LocalisedTable {
    std::string              table;
    std::vector<std::string> fields;  ///< Empty: table has no localisable fields.
};

/// Static description of a record type, declared at registration.
struct RecordType {
    std::string                 name;
    std::string                 base_table;
    std::vector<LocalisedTable> tables;       ///< Every data table, base first.
    std::vector<std::string>    class_names;  ///< Valid ClassName values; empty = any.
    bool                        localised = true;
    bool                        versioned = true;

    const LocalisedTable* find_table(std::string_view table) const;
    bool is_localised_field(std::string_view table, std::string_view field) const;
};

class TypeRegistry {
public:
    /// Throws InvalidState on a duplicate name, an empty table list, or a
    /// first table that is not the base table.
    void add(RecordType type);

    const RecordType& get(std::string_view name) const;
    const RecordType* find(std::string_view name) const;

    /// Types registered with the localised capability, in registration order.
    std::vector<const RecordType*> localised() const;

private:
    std::vector<RecordType> types_;
};

} // namespace sqlocale

// ── query.h ─────────────────────────────────────────────────────
namespace sqlocale {

struct ColumnRef {
    std::string table;   ///< Table alias; empty for an unqualified column.
    std::string column;
};

struct Param {
    Value value;
};

/// A localisable column read through locale aliases in chain order, falling
/// back to the source table's own column.
struct LocalisedColumn {
    ColumnRef                source;
    std::vector<std::string> aliases;
};

using Expr = std::variant<ColumnRef, Param, LocalisedColumn>;

enum class CompareOp : std::uint8_t { Eq, Ne, Lt, Le, Gt, Ge };

struct Comparison {
    Expr      lhs;
    CompareOp op = CompareOp::Eq;
    Expr      rhs;
};

/// Conjunction of comparisons.
using Condition = std::vector<Comparison>;

enum class JoinType : std::uint8_t { From, Inner, Left };

struct TableRef {
    std::string table;
    std::string alias;
    JoinType    join = JoinType::From;
    Condition   on;
};

struct SelectItem {
    Expr        expr;
    std::string alias;
};

struct OrderTerm {
    Expr expr;
    bool descending = false;
};

/// Serialised statement: SQL text plus positional parameters.
struct Sql {
    std::string        text;
    std::vector<Value> params;
};

/// Typed SELECT statement. String assembly happens only in to_sql().
struct SelectQuery {
    std::vector<SelectItem> select;
    std::vector<TableRef>   from;
    Condition               where;
    std::vector<OrderTerm>  order_by;

    void add_from(std::string table, std::string alias = {});
    void add_left_join(std::string table, std::string alias, Condition on);

    TableRef*       find(std::string_view alias);
    const TableRef* find(std::string_view alias) const;

    /// Replace the physical table of every reference to `old_name`; aliases stay.
    void rename_table(std::string_view old_name, std::string_view new_name);

    /// Replace the ON condition of the join with the given alias.
    void set_join_filter(std::string_view alias, Condition on);

    Sql to_sql() const;
};

/// Run a query and collect its rows.
std::vector<Row> execute(sqlite3* db, const SelectQuery& query);

} // namespace sqlocale

// ── manipulation.h ──────────────────────────────────────────────
namespace sqlocale {

enum class WriteCommand : std::uint8_t {
    Insert,  ///< Append a row.
    Update,  ///< Update the row matching `key`.
    Upsert,  ///< Insert, or update the row conflicting on `key`.
    Delete,  ///< Delete rows matching `key`.
};

struct TableWrite {
    WriteCommand             command = WriteCommand::Upsert;
    std::vector<std::string> key;     ///< Key columns; values come from `fields`.
    Row                      fields;
};

/// Pending writes for one record, keyed by physical table.
using Manipulation = std::map<std::string, TableWrite>;

/// Execute every table write of a manipulation.
void apply_writes(sqlite3* db, const Manipulation& manipulation);

} // namespace sqlocale

// ── rewriter.h ──────────────────────────────────────────────────
namespace sqlocale {

enum class VersioningMode : std::uint8_t {
    None,            ///< Query is not versioned.
    Stage,
    StageUnique,
    Archive,
    AllVersions,
    LatestVersions,
    Version,
};

/// Parse a versioning mode name ("stage", "all_versions", ...). An empty
/// string is VersioningMode::None; anything unknown throws
/// UnsupportedVersioningMode.
VersioningMode parse_versioning_mode(std::string_view name);

struct QueryParams {
    VersioningMode mode  = VersioningMode::None;
    Stage          stage = Stage::Draft;
};

/// Rewrites SELECTs on localised types to read locale- and stage-specific
/// tables.
class QueryRewriter {
public:
    explicit QueryRewriter(const LocaleConfig& locales) : locales_(locales) {}

    void augment(SelectQuery& query, const RecordType& type,
                 const QueryParams& params, const Context& ctx) const;

private:
    void localise_base(SelectQuery& query, const RecordType& type,
                       const std::string& locale) const;
    void rename_localised(SelectQuery& query, const RecordType& type,
                          Storage storage) const;
    void add_fallback_chain(SelectQuery& query, const RecordType& type,
                            const std::string& locale) const;

    const LocaleConfig& locales_;
};

/// Splits record writes into locale- and stage-specific table writes.
class WriteRewriter {
public:
    explicit WriteRewriter(const LocaleConfig& locales) : locales_(locales) {}

    void augment(Manipulation& manipulation, const RecordType& type,
                 const Context& ctx) const;

    /// Physical localised table a delete of `table` targets under ctx.
    std::string delete_target(const RecordType& type, std::string_view table,
                              const Context& ctx) const;

    /// Deletes of the record's localised rows in ctx.locale.
    Manipulation delete_targets(const RecordType& type, RecordId id,
                                const Context& ctx) const;

private:
    const LocaleConfig& locales_;
};

} // namespace sqlocale

// ── existence_cache.h ───────────────────────────────────────────
namespace sqlocale {

struct CacheConfig {
    /// Record types whose existence lookups load every ID of a
    /// (table, locale) pair in one query.
    std::vector<std::string> prepopulate_types;
};

/// Answers "does record X have localised rows in locale L in stage S".
///
/// Does NOT own the sqlite3* handle. Not safe for concurrent use.
class ExistenceCache {
public:
    explicit ExistenceCache(sqlite3* db, CacheConfig config = {});
    ~ExistenceCache();

    ExistenceCache(const ExistenceCache&) = delete;
    ExistenceCache& operator=(const ExistenceCache&) = delete;
    ExistenceCache(ExistenceCache&&) noexcept;
    ExistenceCache& operator=(ExistenceCache&&) noexcept;

    bool is_in_stage(const RecordType& type, RecordId id,
                     std::string_view locale, Stage stage);

    /// Load every RecordID present in the localised draft and/or live table
    /// of `type` for `locale`. No-op for a pair that is already loaded.
    void prepopulate(const RecordType& type, std::string_view locale,
                     bool draft = true, bool live = true);

    /// Drop all memoised and prepopulated answers.
    void flush();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlocale

// ── localiser.h ─────────────────────────────────────────────────
namespace sqlocale {

struct LocaliserConfig {
    CacheConfig cache;
};

/// Hook points invoked by the host on every read and write of a localised
/// type, plus the locale existence helpers.
///
/// Does NOT own the sqlite3* handle. Caller must keep it open for
/// the Localiser's lifetime.
class Localiser {
public:
    Localiser(sqlite3* db, LocaleConfig locales, TypeRegistry types,
              LocaliserConfig config = {});
    ~Localiser();

    Localiser(const Localiser&) = delete;
    Localiser& operator=(const Localiser&) = delete;
    Localiser(Localiser&&) noexcept;
    Localiser& operator=(Localiser&&) noexcept;

    void augment_query(SelectQuery& query, std::string_view type,
                       const QueryParams& params, const Context& ctx) const;
    void augment_write(Manipulation& manipulation, std::string_view type,
                       const Context& ctx) const;
    Manipulation delete_targets(std::string_view type, RecordId id,
                                const Context& ctx) const;

    /// `locale` defaults to ctx.locale; false when neither is set.
    bool is_drafted_in_locale(std::string_view type, RecordId id,
                              const Context& ctx,
                              std::optional<std::string> locale = std::nullopt);
    bool is_published_in_locale(std::string_view type, RecordId id,
                                const Context& ctx,
                                std::optional<std::string> locale = std::nullopt);
    bool exists_in_locale(std::string_view type, RecordId id,
                          const Context& ctx,
                          std::optional<std::string> locale = std::nullopt);

    void flush_cache();
    void prepopulate(std::string_view type, std::string_view locale,
                     bool draft = true, bool live = true);

    const LocaleConfig& locales() const;
    const TypeRegistry& types() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Create the localised draft, live and versions tables of `type`.
void ensure_localised_tables(sqlite3* db, const RecordType& type);

} // namespace sqlocale

// ── record_store.h ──────────────────────────────────────────────
namespace sqlocale {

/// A record's rows, one per data table of its type.
struct Record {
    const RecordType*          type = nullptr;
    RecordId                   id = 0;
    std::map<std::string, Row> tables;
};

/// Draft/publish workflow of the host persistence layer.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual Record load(const RecordType& type, RecordId id) = 0;
    virtual bool is_published(const Record& record) = 0;

    /// Save the record's rows to draft storage under ctx.locale.
    virtual void write(const Record& record, const Context& ctx) = 0;

    /// Save and mirror into live storage. Returns false if publishing failed.
    virtual bool publish(const Record& record, const Context& ctx) = 0;
};

/// RecordStore over SQLite tables laid out as `T`, `T_Live`, `T_Versions`.
///
/// Does NOT own the sqlite3* handle.
class SqliteRecordStore : public RecordStore {
public:
    SqliteRecordStore(sqlite3* db, Localiser& localiser)
        : db_(db), localiser_(localiser) {}

    Record load(const RecordType& type, RecordId id) override;
    bool is_published(const Record& record) override;
    void write(const Record& record, const Context& ctx) override;
    bool publish(const Record& record, const Context& ctx) override;

    /// Remove the record from ctx.locale in ctx.stage.
    void delete_from_locale(const Record& record, const Context& ctx);

private:
    void save(const Record& record, const Context& ctx, bool live);

    sqlite3*   db_;
    Localiser& localiser_;
};

} // namespace sqlocale

// ── migrator.h ──────────────────────────────────────────────────
namespace sqlocale {

/// Runs a callable inside some scope (a transaction, a privilege context).
using ScopeFn = std::function<void(const std::function<void()>&)>;

struct MigrationConfig {
    /// Wraps the whole run. Must roll back if the callable throws.
    /// Default (nullptr): a transaction on the migrating connection.
    ScopeFn transaction = nullptr;

    /// Elevated privilege context for publishing. Default: direct call.
    ScopeFn privileged = nullptr;
};

struct MigrationReport {
    std::size_t types_migrated   = 0;
    std::size_t types_skipped    = 0;
    std::size_t groups           = 0;
    std::size_t records_replayed = 0;
    std::size_t records_skipped  = 0;
};

/// One-time conversion of "one row per locale" legacy translation groups
/// into one canonical record with localised rows.
///
/// Does NOT own the sqlite3* handle. Assumes exclusive access to the data
/// for the duration of run().
class Migrator {
public:
    Migrator(sqlite3* db, Localiser& localiser, RecordStore& store,
             MigrationConfig config = {});
    ~Migrator();

    Migrator(const Migrator&) = delete;
    Migrator& operator=(const Migrator&) = delete;

    /// Throws ConfigurationError before touching data if no locales or no
    /// default locale are configured, and PublishFailure (after rollback)
    /// if any record fails to publish.
    MigrationReport run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlocale
