// Misc sqlite helpers

#include "app.h"
#include "sql_helpers.h"

using namespace std;


// Opens the specified sqlite db and returns a ptr to it, or NULL on failure.
sqlite3* sqlite_get_db(const char *path) {
    sqlite3 *db = NULL;

    if (sqlite3_open(path, &db) != SQLITE_OK) {
        error(string("Failed to open db ") + path + ": " + sqlite3_errmsg(db));
        sqlite3_close(db);
        return NULL;
    }

    return db;
}

// Executes the given sql query in the context of the specified DB.
int sqlite_exec(sqlite3 *db, const char *sql_query) {
    char *zErrMsg = NULL;

    int rc = sqlite3_exec(db, sql_query, NULL, 0, &zErrMsg);

    if (rc != SQLITE_OK) {
        error(string("SQL error on query: ") + sql_query + " -- " +
              (zErrMsg ? zErrMsg : "unknown"));
        sqlite3_free(zErrMsg);
        return 0;
    }

    return 1;
}

// Creates a table having the given cols in the given sqlite database.
// If drop_existing is true, the table is dropped if it exists before creation.
// Each element in columns is that cols definition, ex: "NAME TYPE NOT NULL"
int sqlite_create_table(sqlite3 *db,
                        const string &name,
                        const vector<string> &columns,
                        bool drop_existing) {
    string str_query;

    if (drop_existing) {
        str_query = "DROP TABLE IF EXISTS " + name;
        if (!sqlite_exec(db, str_query.c_str()))
            return 0;
    }

    // Build the sql query CREATE statement
    str_query = "CREATE TABLE IF NOT EXISTS " + name + "(";

    for (size_t i = 0; i < columns.size(); i++) {
        str_query += columns[i];

        if (i < (columns.size() - 1))
            str_query += ",";
    }

    str_query += ");";

    return sqlite_exec(db, str_query.c_str());
}

// Returns the row count of the given table, or -1 on error.
long sqlite_count(sqlite3 *db, const string &table) {
    sqlite3_stmt *stmt = NULL;
    string query = "SELECT COUNT(*) FROM " + table;

    if (sqlite3_prepare_v2(db, query.c_str(), -1, &stmt, NULL) != SQLITE_OK) {
        error("SQL error on query: " + query + " -- " + sqlite3_errmsg(db));
        return -1;
    }

    long count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW)
        count = sqlite3_column_int64(stmt, 0);

    sqlite3_finalize(stmt);
    return count;
}
