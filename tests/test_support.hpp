/**
 * @file test_support.hpp
 * @brief Shared fixtures for the KronVault unit tests.
 */

#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <vector>
#include <sqlite3.h>
#include <gtest/gtest.h>
#include "logger.hpp"
#include "process_runner.hpp"

/**
 * @brief Temporary directory removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("kronvault-test-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Scripted process runner recording every request.
 *
 * The handler decides the outcome; when a request streams stdout into a file the captured
 * text is written there, and a `--file=` argument gets an empty file, as the real tools do.
 */
class FakeProcessRunner : public ProcessRunner {
public:
    using Handler = std::function<Result<ProcessResult>(const ProcessRequest&)>;

    FakeProcessRunner() : handler([](const ProcessRequest&) { return Result<ProcessResult>(ProcessResult{0, "", ""}); }) {}
    explicit FakeProcessRunner(Handler handler) : handler(std::move(handler)) {}

    Result<ProcessResult> run(const ProcessRequest& request) override {
        requests.push_back(request);
        auto result = handler(request);
        if (!result) {
            return result;
        }
        if (request.stdoutFile) {
            std::ofstream out(*request.stdoutFile, std::ios::binary);
            out << result->stdoutText;
            result->stdoutText.clear();
        }
        if (result->success()) {
            for (const auto& arg : request.args) {
                if (arg.rfind("--file=", 0) == 0) {
                    std::ofstream(arg.substr(7)) << "PGDMP";
                }
            }
        }
        return result;
    }

    static bool hasArg(const ProcessRequest& request, const std::string& arg) {
        return std::find(request.args.begin(), request.args.end(), arg) != request.args.end();
    }

    Handler handler;
    std::vector<ProcessRequest> requests;
};

inline ProcessResult succeeded(std::string stdoutText = "") {
    return ProcessResult{0, std::move(stdoutText), ""};
}

inline ProcessResult failed(int exitCode, std::string stderrText) {
    return ProcessResult{exitCode, "", std::move(stderrText)};
}

/**
 * @brief Creates a SQLite database with one table holding the given number of rows.
 */
inline void createSqliteDatabase(const std::filesystem::path& path, int rows) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db, "CREATE TABLE items(id INTEGER PRIMARY KEY, name TEXT, payload BLOB)",
                           nullptr, nullptr, nullptr), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db, "BEGIN", nullptr, nullptr, nullptr), SQLITE_OK);
    for (int i = 0; i < rows; ++i) {
        std::string sql = "INSERT INTO items(name, payload) VALUES ('item-" + std::to_string(i)
            + "', randomblob(200))";
        ASSERT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
    }
    ASSERT_EQ(sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);
}

/**
 * @brief Returns the rows of the items table as "id:name" strings.
 */
inline std::vector<std::string> readSqliteRows(const std::filesystem::path& path) {
    std::vector<std::string> rows;
    sqlite3* db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return rows;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT id, name, hex(payload) FROM items ORDER BY id", -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            rows.push_back(std::to_string(sqlite3_column_int(stmt, 0)) + ":"
                + reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)) + ":"
                + reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)));
        }
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return rows;
}

inline int sqlitePageCount(const std::filesystem::path& path) {
    sqlite3* db = nullptr;
    int pages = 0;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) == SQLITE_OK) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, "PRAGMA page_count", -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            pages = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    sqlite3_close(db);
    return pages;
}

#endif // TEST_SUPPORT_HPP
