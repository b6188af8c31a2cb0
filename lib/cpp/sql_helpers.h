// Misc sqlite helpers

#ifndef GAZEGUARD_SQL_HELPERS_H
#define GAZEGUARD_SQL_HELPERS_H

#include <string>
#include <vector>

#include <sqlite3.h>


sqlite3* sqlite_get_db(const char *path);
int sqlite_exec(sqlite3 *db, const char *sql_query);
int sqlite_create_table(sqlite3 *db,
                        const std::string &name,
                        const std::vector<std::string> &columns,
                        bool drop_existing=false);
long sqlite_count(sqlite3 *db, const std::string &table);


#endif // Top-level include guard
