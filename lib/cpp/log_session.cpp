/////////////////////////////////////////////////////////////////////////////
// A logging session recording gaze samples and tracking events to sqlite.
//
/////////////////////////////////////////////////////////////////////////////

#include "app.h"
#include "log_session.h"
#include "sql_helpers.h"

using namespace std;


LogSession::LogSession(const string &db_path, int write_freq) {
    m_db_path = db_path;
    m_write_freq = write_freq > 0 ? write_freq : 1;
    m_db = NULL;
    m_pending = make_shared<vector<gaze_point_t>>();
}

LogSession::~LogSession() {
    stop();
}

// Opens the session db and creates its tables, replacing any from a
// previous session.
void LogSession::start() {
    if (m_db) {
        warn("Log session start attempted but already running.");
        return;
    }

    m_db = sqlite_get_db(m_db_path.c_str());
    if (!m_db)
        throw AppError("Failed to open log session db " + m_db_path);

    vector<string> gaze_cols;
    gaze_cols.push_back("pkey INTEGER PRIMARY KEY AUTOINCREMENT");
    gaze_cols.push_back("unixtime_us INT NOT NULL");
    gaze_cols.push_back("x_normed REAL");
    gaze_cols.push_back("y_normed REAL");

    vector<string> event_cols;
    event_cols.push_back("pkey INTEGER PRIMARY KEY AUTOINCREMENT");
    event_cols.push_back("unixtime_us INT NOT NULL");
    event_cols.push_back("object_id INT NOT NULL");
    event_cols.push_back("event TEXT NOT NULL");
    event_cols.push_back("x INT");
    event_cols.push_back("y INT");
    event_cols.push_back("w INT");
    event_cols.push_back("h INT");

    if (!sqlite_create_table(m_db, GAZE_SAMPLES_TABLE, gaze_cols, true) ||
        !sqlite_create_table(m_db, TRACK_EVENTS_TABLE, event_cols, true)) {
        sqlite3_close(m_db);
        m_db = NULL;
        throw AppError("Failed to create log session tables in " + m_db_path);
    }

    info("Log session started: " + m_db_path);
}

// Flushes pending samples, waits for the writer and closes the db.
void LogSession::stop() {
    if (!m_db)
        return;

    join_writer();

    if (!m_pending->empty()) {
        write_gaze(m_pending);
        m_pending = make_shared<vector<gaze_point_t>>();
    }

    sqlite3_close(m_db);
    m_db = NULL;
    info("Log session stopped.");
}

// Queues gaze samples. Every m_write_freq samples the queue is written to
// the db asynchronously.
void LogSession::log_gaze(const vector<gaze_point_t> &samples) {
    if (!m_db)
        return;

    m_pending->insert(m_pending->end(), samples.begin(), samples.end());
    if (static_cast<int>(m_pending->size()) < m_write_freq)
        return;

    // Ensure any previous async write job has finished
    join_writer();

    shared_ptr<vector<gaze_point_t>> batch = m_pending;
    m_pending = make_shared<vector<gaze_point_t>>();
    m_async_writer = make_shared<boost::thread>(&LogSession::write_gaze, this, batch);
}

void LogSession::log_event(int64_t unixtime_us, const track_event_t &event) {
    if (!m_db)
        return;

    boost::mutex::scoped_lock lock(m_db_mutex);

    sqlite3_stmt *stmt = NULL;
    const char *query = "INSERT INTO " TRACK_EVENTS_TABLE
        " (unixtime_us, object_id, event, x, y, w, h) VALUES (?, ?, ?, ?, ?, ?, ?)";

    if (sqlite3_prepare_v2(m_db, query, -1, &stmt, NULL) != SQLITE_OK) {
        error(string("Failed to log track event: ") + sqlite3_errmsg(m_db));
        return;
    }

    sqlite3_bind_int64(stmt, 1, unixtime_us);
    sqlite3_bind_int(stmt, 2, event.object_id);
    sqlite3_bind_text(stmt, 3, track_event_name(event.type), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 4, event.box.x);
    sqlite3_bind_int(stmt, 5, event.box.y);
    sqlite3_bind_int(stmt, 6, event.box.width);
    sqlite3_bind_int(stmt, 7, event.box.height);

    if (sqlite3_step(stmt) != SQLITE_DONE)
        error(string("Failed to log track event: ") + sqlite3_errmsg(m_db));

    sqlite3_finalize(stmt);
}

long LogSession::count(const string &table) {
    if (!m_db)
        return -1;

    join_writer();

    boost::mutex::scoped_lock lock(m_db_mutex);
    return sqlite_count(m_db, table);
}

// Writes the given samples in a single transaction. Invalid samples are
// stored with NULL coords.
void LogSession::write_gaze(shared_ptr<vector<gaze_point_t>> samples) {
    boost::mutex::scoped_lock lock(m_db_mutex);

    sqlite3_stmt *stmt = NULL;
    const char *query = "INSERT INTO " GAZE_SAMPLES_TABLE
        " (unixtime_us, x_normed, y_normed) VALUES (?, ?, ?)";

    if (!sqlite_exec(m_db, "BEGIN TRANSACTION"))
        return;

    if (sqlite3_prepare_v2(m_db, query, -1, &stmt, NULL) != SQLITE_OK) {
        error(string("Failed to log gaze samples: ") + sqlite3_errmsg(m_db));
        sqlite_exec(m_db, "ROLLBACK");
        return;
    }

    for (const gaze_point_t &gp : *samples) {
        sqlite3_bind_int64(stmt, 1, gp.unixtime_us);
        if (gaze_is_valid(gp)) {
            sqlite3_bind_double(stmt, 2, gp.x_normed);
            sqlite3_bind_double(stmt, 3, gp.y_normed);
        } else {
            sqlite3_bind_null(stmt, 2);
            sqlite3_bind_null(stmt, 3);
        }

        if (sqlite3_step(stmt) != SQLITE_DONE)
            error(string("Failed to log gaze sample: ") + sqlite3_errmsg(m_db));
        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);
    sqlite_exec(m_db, "COMMIT");
}

void LogSession::join_writer() {
    if (m_async_writer) {
        m_async_writer->join();
        m_async_writer = NULL;
    }
}
