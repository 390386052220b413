// test/unit/test_dictionary_loader.cpp
// -----------------------------------------------------------
// Dictionary sources: plain text, gzip and SQLite tables.

#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

#include "dictionary/dictionary_loader.hpp"

namespace {

using phiscan::dictionary::DictionaryLoader;

const char *kContent = "# first names\n"
                       "John\n"
                       "\n"
                       "  Mary Ann  \n"
                       "Jos\xC3\xA9\r\n";

TEST(DictionaryLoaderTest, ParsesLinesSkippingCommentsAndBlanks) {
    auto terms = DictionaryLoader::parseLines(kContent);
    ASSERT_EQ(terms.size(), (size_t)3);
    EXPECT_EQ(terms[0], "John");
    EXPECT_EQ(terms[1], "Mary Ann");
    EXPECT_EQ(terms[2], "Jos\xC3\xA9");
}

TEST(DictionaryLoaderTest, LoadsTextFile) {
    const std::string filename = "test_dictionary_names.txt";
    {
        std::ofstream out(filename, std::ios::binary);
        out << kContent;
    }

    auto terms = DictionaryLoader::load(filename);
    EXPECT_EQ(terms, DictionaryLoader::parseLines(kContent));

    std::remove(filename.c_str());
}

TEST(DictionaryLoaderTest, LoadsGzipFile) {
    const std::string filename = "test_dictionary_names.txt.gz";
    {
        gzFile out = gzopen(filename.c_str(), "wb");
        ASSERT_NE(out, nullptr);
        const std::string content(kContent);
        ASSERT_EQ(gzwrite(out, content.data(), static_cast<unsigned>(content.size())),
                  static_cast<int>(content.size()));
        gzclose(out);
    }

    auto terms = DictionaryLoader::load(filename);
    ASSERT_EQ(terms.size(), (size_t)3);
    EXPECT_EQ(terms[1], "Mary Ann");

    std::remove(filename.c_str());
}

TEST(DictionaryLoaderTest, LoadsSqliteTable) {
    const std::string filename = "test_dictionary_cities.db";
    std::remove(filename.c_str());
    {
        sqlite3 *db = nullptr;
        ASSERT_EQ(sqlite3_open(filename.c_str(), &db), SQLITE_OK);
        const char *sql =
            "CREATE TABLE cities (name TEXT, state TEXT);"
            "INSERT INTO cities VALUES ('Springfield', 'IL');"
            "INSERT INTO cities VALUES (NULL, 'MA');"
            "INSERT INTO cities VALUES ('   ', 'NY');"
            "INSERT INTO cities VALUES (' Shelbyville ', 'KY');";
        ASSERT_EQ(sqlite3_exec(db, sql, nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);
    }

    auto terms = DictionaryLoader::load("sqlite:" + filename + "#cities");
    ASSERT_EQ(terms.size(), (size_t)2);
    EXPECT_EQ(terms[0], "Springfield");
    EXPECT_EQ(terms[1], "Shelbyville");

    auto states = DictionaryLoader::loadSqliteTable(filename, "cities", "state");
    EXPECT_EQ(states.size(), (size_t)4);

    EXPECT_THROW(DictionaryLoader::load("sqlite:" + filename + "#no_such_table"), std::runtime_error);
    EXPECT_THROW(DictionaryLoader::loadSqliteTable(filename, "cities; DROP TABLE cities"), std::runtime_error);

    std::remove(filename.c_str());
}

TEST(DictionaryLoaderTest, BadSourcesThrow) {
    EXPECT_THROW(DictionaryLoader::load("no_such_dictionary.txt"), std::runtime_error);
    EXPECT_THROW(DictionaryLoader::load("no_such_dictionary.txt.gz"), std::runtime_error);
    EXPECT_THROW(DictionaryLoader::load("sqlite:missing_table_part.db"), std::runtime_error);
    EXPECT_THROW(DictionaryLoader::load("sqlite:#cities"), std::runtime_error);
    EXPECT_THROW(DictionaryLoader::load("sqlite:no_such_database.db#cities"), std::runtime_error);
}

} // anonymous namespace
