#ifndef PHISCAN_DICTIONARY_DICTIONARY_LOADER_HPP
#define PHISCAN_DICTIONARY_DICTIONARY_LOADER_HPP

#include <cctype>
#include <fstream>
#include <sqlite3.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

#include "../util/logger.hpp"
#include "../util/text_utils.hpp"

/**
 * @file dictionary_loader.hpp
 * @brief Reads dictionary terms from disk for the fuzzy matchers.
 *
 * Sources:
 *   - "path/to/names.txt"         one term per line
 *   - "path/to/names.txt.gz"      the same, gzip compressed
 *   - "sqlite:path/to/db#table"   the `name` column of a table
 *
 * Blank lines and lines starting with '#' are skipped in text sources.
 * Every failure throws std::runtime_error; a dictionary that cannot be read is
 * a configuration error, not something to detect around.
 */

namespace phiscan {
namespace dictionary {

class DictionaryLoader
{
public:
    /**
     * @brief Load terms from a source string (see file comment).
     */
    static std::vector<std::string> load(const std::string &source)
    {
        std::vector<std::string> terms;
        const std::string sqlitePrefix = "sqlite:";

        if (source.rfind(sqlitePrefix, 0) == 0) {
            const std::string spec = source.substr(sqlitePrefix.size());
            const auto hash = spec.rfind('#');
            if (hash == std::string::npos || hash == 0 || hash + 1 == spec.size()) {
                throw std::runtime_error("DictionaryLoader: expected sqlite:<db>#<table>, got '" + source + "'");
            }
            terms = loadSqliteTable(spec.substr(0, hash), spec.substr(hash + 1));
        }
        else if (endsWith(source, ".gz")) {
            terms = loadGzipFile(source);
        }
        else {
            terms = loadTextFile(source);
        }

        util::logger::info("[DictionaryLoader] " + std::to_string(terms.size()) + " terms from " + source);
        return terms;
    }

    static std::vector<std::string> loadTextFile(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw std::runtime_error("DictionaryLoader: cannot open " + path);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        return parseLines(buffer.str());
    }

    static std::vector<std::string> loadGzipFile(const std::string &path)
    {
        gzFile file = gzopen(path.c_str(), "rb");
        if (file == nullptr) {
            throw std::runtime_error("DictionaryLoader: cannot open " + path);
        }

        std::string content;
        char chunk[16384];
        int n = 0;
        while ((n = gzread(file, chunk, sizeof(chunk))) > 0) {
            content.append(chunk, static_cast<std::size_t>(n));
        }

        if (n < 0) {
            int errnum = 0;
            const char *msg = gzerror(file, &errnum);
            std::string detail = msg ? msg : "unknown error";
            gzclose(file);
            throw std::runtime_error("DictionaryLoader: gzip read failed for " + path + ": " + detail);
        }
        gzclose(file);
        return parseLines(content);
    }

    /**
     * @brief Read the `column` values of a table, skipping NULL and blank rows.
     */
    static std::vector<std::string> loadSqliteTable(const std::string &dbPath, const std::string &table,
                                                    const std::string &column = "name")
    {
        if (!isIdentifier(table) || !isIdentifier(column)) {
            throw std::runtime_error("DictionaryLoader: invalid table or column name '" + table + "." + column + "'");
        }

        sqlite3 *db = nullptr;
        if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            throw std::runtime_error("DictionaryLoader: cannot open database " + dbPath + ": " + msg);
        }

        const std::string sql = "SELECT " + column + " FROM " + table;
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            sqlite3_close(db);
            throw std::runtime_error("DictionaryLoader: query failed on " + dbPath + ": " + msg);
        }

        std::vector<std::string> terms;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            if (text == nullptr) {
                continue;
            }
            std::string term = util::trim(reinterpret_cast<const char *>(text));
            if (!term.empty()) {
                terms.push_back(std::move(term));
            }
        }

        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            sqlite3_close(db);
            throw std::runtime_error("DictionaryLoader: reading " + table + " failed: " + msg);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return terms;
    }

    static std::vector<std::string> parseLines(const std::string &content)
    {
        std::vector<std::string> terms;
        std::istringstream in(content);
        std::string line;
        while (std::getline(in, line)) {
            line = util::trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            terms.push_back(line);
        }
        return terms;
    }

private:
    static bool endsWith(const std::string &s, const std::string &suffix)
    {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static bool isIdentifier(const std::string &s)
    {
        if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0]))) {
            return false;
        }
        for (unsigned char c : s) {
            if (!std::isalnum(c) && c != '_') {
                return false;
            }
        }
        return true;
    }
};

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_DICTIONARY_LOADER_HPP
