#include "database.hpp"
#include "dates.hpp"
#include "errors.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string_view>
#include <system_error>


template<typename... Args>
std::string format_string(Args&&... args)
{
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

namespace
{
    struct StmtDeleter
    {
        void operator()(sqlite3_stmt* s) const noexcept
        {
            if(s) sqlite3_finalize(s);
        }
    };

    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

    StmtPtr prepare(sqlite3* db, const char* sql)
    {
        sqlite3_stmt* stmt = nullptr;
        if(sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            throw StoreError
            (
                format_string("Failed to prepare statement: ", sqlite3_errmsg(db), "\nQuery: ", sql)
            );
        }
        return StmtPtr(stmt);
    }

    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value)
    {
        sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
}


NewsStore::NewsStore(std::string_view path, bool initialize)
    : path_(path)
{
    if(initialize)
    {
        try
        {
            open_file();
            reset_history();
        }
        catch(const StoreError& e)
        {
            std::cerr << "[Store] Existing state unusable (" << e.what() << "), recreating " << path_ << '\n';
            db_.reset();
            remove_files();
            open_file();
        }
    }
    else
    {
        open_file();
        check_integrity();
    }

    init_tables();
    upgrade_columns();

    std::cout << "[Store] Opened " << path_ << " with " << count() << " known items\n";
}

void NewsStore::open_file()
{
    sqlite3* raw_db = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &raw_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    db_.reset(raw_db);

    if(rc != SQLITE_OK)
    {
        std::string error = raw_db ? sqlite3_errmsg(raw_db) : "out of memory";
        db_.reset();
        throw StoreError
        (
           format_string("Cannot open database: ", path_, " (", error, ")")
        );
    }

    // The state travels between runs as a single file.
    execute_sql("PRAGMA busy_timeout=500;");
    execute_sql("PRAGMA journal_mode=DELETE;");
}

void NewsStore::check_integrity()
{
    auto stmt = prepare(db_.get(), "PRAGMA quick_check;");

    int rc = sqlite3_step(stmt.get());
    if(rc != SQLITE_ROW)
    {
        throw StoreError
        (
            format_string("Integrity check failed for ", path_, ": ", sqlite3_errmsg(db_.get()))
        );
    }

    const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    if(!result || std::string_view(result) != "ok")
    {
        throw StoreError
        (
            format_string("Integrity check failed for ", path_, ": ", result ? result : "no result")
        );
    }
}

void NewsStore::reset_history()
{
    check_integrity();
    execute_sql("DROP TABLE IF EXISTS news_items;");
    std::cout << "[Store] Initialize mode: dropped previous history\n";
}

void NewsStore::remove_files()
{
    for(const char* suffix : {"", "-journal", "-wal", "-shm"})
    {
        std::error_code ec;
        std::filesystem::remove(path_ + suffix, ec);
        if(ec)
        {
            throw StoreError
            (
                format_string("Cannot remove ", path_, suffix, ": ", ec.message())
            );
        }
    }
}

void NewsStore::init_tables()
{
    execute_sql
    (
        "CREATE TABLE IF NOT EXISTS news_items("
        "guid TEXT PRIMARY KEY,"
        "pub_date TEXT,"
        "title TEXT,"
        "link TEXT,"
        "recorded_at TEXT);"
    );
}

// Older state files carry only (guid, pub_date, title); the rest is added.
void NewsStore::upgrade_columns()
{
    std::unordered_set<std::string> columns;
    bool guid_is_key = false;

    {
        auto stmt = prepare(db_.get(), "PRAGMA table_info(news_items);");

        int rc;
        while((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
            if(!name)
                continue;
            columns.emplace(name);
            if(std::string_view(name) == "guid" && sqlite3_column_int(stmt.get(), 5) > 0)
                guid_is_key = true;
        }

        if(rc != SQLITE_DONE)
        {
            throw StoreError
            (
                format_string("Failed to read news_items schema: ", sqlite3_errmsg(db_.get()))
            );
        }
    }

    if(!columns.count("guid"))
        throw StoreError(format_string("Incompatible state file ", path_, ": news_items has no guid column"));

    // INSERT OR IGNORE relies on guid being unique.
    if(!guid_is_key)
        execute_sql("CREATE UNIQUE INDEX IF NOT EXISTS news_items_guid ON news_items(guid);");

    for(const char* column : {"pub_date", "title", "link", "recorded_at"})
    {
        if(columns.count(column))
            continue;

        execute_sql(format_string("ALTER TABLE news_items ADD COLUMN ", column, " TEXT;"));
        std::cout << "[Store] Added missing column " << column << " to " << path_ << '\n';
    }
}

std::unordered_set<std::string> NewsStore::known_guids() const
{
    require_open();

    std::unordered_set<std::string> guids;
    auto stmt = prepare(db_.get(), "SELECT guid FROM news_items;");

    int rc;
    while((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        const char* guid = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        if(guid) guids.emplace(guid);
    }

    if(rc != SQLITE_DONE)
    {
        throw StoreError
        (
            format_string("Failed to read known guids: ", sqlite3_errmsg(db_.get()))
        );
    }

    return guids;
}

void NewsStore::record(const std::vector<News::NewsItem>& items)
{
    require_open();
    if(items.empty())
        return;

    execute_sql("BEGIN IMMEDIATE;");

    try
    {
        auto stmt = prepare
        (
            db_.get(),
            "INSERT OR IGNORE INTO news_items (guid, pub_date, title, link, recorded_at) "
            "VALUES (?, ?, ?, ?, ?);"
        );

        const std::string recorded_at = Dates::format_iso8601(std::chrono::system_clock::now());

        for(const auto& item : items)
        {
            bind_text(stmt.get(), 1, item.guid);

            if(item.pub_date) bind_text(stmt.get(), 2, Dates::format_iso8601(*item.pub_date));
            else sqlite3_bind_null(stmt.get(), 2);

            bind_text(stmt.get(), 3, item.title);
            bind_text(stmt.get(), 4, item.link);
            bind_text(stmt.get(), 5, recorded_at);

            if(sqlite3_step(stmt.get()) != SQLITE_DONE)
            {
                throw StoreError
                (
                    format_string("Failed to record ", item.guid, ": ", sqlite3_errmsg(db_.get()))
                );
            }

            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
        }

        stmt.reset();
        execute_sql("COMMIT;");
    }
    catch(const StoreError&)
    {
        sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    std::cout << "[Store] Recorded " << items.size() << " items\n";
}

std::size_t NewsStore::count() const
{
    require_open();

    auto stmt = prepare(db_.get(), "SELECT COUNT(*) FROM news_items;");
    if(sqlite3_step(stmt.get()) != SQLITE_ROW)
    {
        throw StoreError
        (
            format_string("Failed to count items: ", sqlite3_errmsg(db_.get()))
        );
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

void NewsStore::close() noexcept
{
    if(db_)
    {
        db_.reset();
        std::cout << "[Store] Closed " << path_ << '\n';
    }
}

void NewsStore::require_open() const
{
    if(!db_)
        throw StoreError(format_string("Store is closed: ", path_));
}

void NewsStore::execute_sql(std::string_view sql)
{
    char* error_msg = nullptr;

    if(sqlite3_exec(db_.get(), sql.data(), nullptr, nullptr, &error_msg) != SQLITE_OK)
    {
        std::string error = error_msg ? error_msg : sqlite3_errmsg(db_.get());
        sqlite3_free(error_msg);

        throw StoreError
        (
            format_string("SQL execution failed: ", error, "\nQuery: ", sql)
        );
    }
}
