#pragma once

#include "news_item.hpp"

#include <sqlite3.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

// Dedupe history of delivered items, one row per guid in news_items.
class NewsStore
{
public:

    // Opens or creates the state file. initialize drops the history first.
    // Throws StoreError when an existing file cannot be read as a database.
    NewsStore(std::string_view path, bool initialize);
    ~NewsStore() = default;

    // no copy constructor or operator
    NewsStore(const NewsStore&) = delete;
    NewsStore& operator=(const NewsStore&) = delete;

    NewsStore(NewsStore&&) = default;
    NewsStore& operator=(NewsStore&&) noexcept = default;

    [[nodiscard]] std::unordered_set<std::string> known_guids() const;

    // All-or-nothing: either every item is committed or none is.
    void record(const std::vector<News::NewsItem>& items);

    [[nodiscard]] std::size_t count() const;

    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    [[nodiscard]] sqlite3* get() const noexcept {return db_.get();}
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:

    struct SQLiteDeleter
    {
        void operator()(sqlite3* db) const noexcept
        {
            sqlite3_close(db);
        }
    };

    std::string path_;
    std::unique_ptr<sqlite3, SQLiteDeleter> db_;

    void open_file();
    void check_integrity();
    void reset_history();
    void remove_files();
    void execute_sql(std::string_view sql);
    void init_tables();
    void upgrade_columns();
    void require_open() const;
};
