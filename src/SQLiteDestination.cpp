// <SQLiteDestination> -*- C++ -*-

#include "mdb2sqlite/dest/SQLiteDestination.hpp"
#include "mdb2sqlite/schema/SchemaTranslator.hpp"
#include "mdb2sqlite/log/MessageSource.hpp"
#include "mdb2sqlite/utils/StringUtils.hpp"
#include "mdb2sqlite/Errors.hpp"

//SQLite-specific headers
#include <sqlite3.h>

//Standard headers
#include <cstdlib>
#include <fstream>
#include <unordered_map>

namespace mdb2sqlite {

namespace {

//! Signature of the callback forwarded to sqlite3_exec()
typedef int (*sqlite_select_callback)(void *, int, char **, char **);

//! Execute a SQL statement on an open database connection.
//! Rows returned by a SELECT are handed to the optional
//! callback. Throws DestinationError with the SQLite message
//! and the failed statement.
void LOCAL_eval_sql(sqlite3 * db_conn,
                    const std::string & command,
                    sqlite_select_callback user_callback = nullptr,
                    void * callback_obj = nullptr)
{
    char * err = 0;
    const int res = sqlite3_exec(db_conn,
                                 command.c_str(),
                                 user_callback,
                                 callback_obj,
                                 &err);
    if (res != SQLITE_OK) {
        std::string err_str;
        if (err) {
            //If our char* has an error message in it,
            //we will add it to the exception.
            err_str = err;
            sqlite3_free(err);
        } else {
            //Otherwise, just add the SQLite error code.
            err_str = sqlite3_errstr(res);
        }
        throw DestinationError(err_str) << " (failed SQL command was '"
                                        << command << "')";
    }
}

//! Look at an existing destination file and decide whether it
//! can be written to. The file is opened read-only so that it
//! is left exactly as it was when it is refused.
void LOCAL_verify_empty_destination(const std::string & db_file)
{
    std::ifstream fin(db_file, std::ios::binary | std::ios::ate);
    if (!fin) {
        //Nothing there yet
        return;
    }
    if (fin.tellg() == 0) {
        return;
    }
    fin.close();

    sqlite3 * db_conn = nullptr;
    if (sqlite3_open_v2(db_file.c_str(), &db_conn, SQLITE_OPEN_READONLY, 0) != SQLITE_OK) {
        sqlite3_close(db_conn);
        throw OpenError("Destination file '") << db_file << "' is not empty";
    }

    int num_objects = -1;
    auto count_objects = +[](void * count, int argc, char ** argv, char **) {
        if (argc == 1 && argv[0]) {
            *static_cast<int*>(count) = atoi(argv[0]);
        }
        return 0;
    };

    char * err = 0;
    const int res = sqlite3_exec(db_conn, "SELECT COUNT(*) FROM sqlite_master",
                                 count_objects, &num_objects, &err);
    if (err) {
        sqlite3_free(err);
    }
    sqlite3_close(db_conn);

    //Not a SQLite file at all, or a database that has something in it
    if (res != SQLITE_OK || num_objects != 0) {
        throw OpenError("Destination file '") << db_file << "' is not empty";
    }
}

} // namespace

//! Implementation class for the SQLite destination connection.
class SQLiteDestination::Impl
{
public:
    explicit Impl(const std::string & db_file) :
        db_file_(db_file)
    {
        LOCAL_verify_empty_destination(db_file);

        const int db_open_flags = SQLITE_OPEN_CREATE | SQLITE_OPEN_READWRITE;
        sqlite3 * sqlite_conn = nullptr;
        auto err_code = sqlite3_open_v2(db_file.c_str(), &sqlite_conn, db_open_flags, 0);

        //Inability to even open the database file may mean that
        //we don't have write permissions in this directory or
        //that the directory does not exist.
        if (err_code != SQLITE_OK) {
            std::string reason = sqlite_conn ? sqlite3_errmsg(sqlite_conn) : sqlite3_errstr(err_code);
            sqlite3_close(sqlite_conn);
            throw OpenError("Unable to open the destination database file '")
                << db_file << "': " << reason;
        }

        if (sqlite3_db_readonly(sqlite_conn, "main") == 1) {
            sqlite3_close(sqlite_conn);
            throw OpenError("Destination database file '") << db_file
                << "' is not writable";
        }

        db_conn_ = sqlite_conn;

        if (debug_) {
            debug_ << "Opened destination '" << db_file << "'";
        }
    }

    ~Impl()
    {
        for (auto & stmt : insert_stmts_) {
            sqlite3_finalize(stmt.second);
        }
        insert_stmts_.clear();

        if (db_conn_) {
            sqlite3_close(db_conn_);
        }
    }

    const std::string & getDatabaseFilename() const
    {
        return db_file_;
    }

    void evalSql(const std::string & command) const
    {
        if (debug_) {
            debug_ << command;
        }
        LOCAL_eval_sql(db_conn_, command);
    }

    void evalSqlSelect(const std::string & command,
                       sqlite_select_callback callback,
                       void * callback_obj) const
    {
        LOCAL_eval_sql(db_conn_, command, callback, callback_obj);
    }

    bool inTransaction() const
    {
        return sqlite3_get_autocommit(db_conn_) == 0;
    }

    void insert(const std::string & table_name, const Row & values)
    {
        sqlite3_stmt * stmt = getInsertStatement_(table_name, values.size());

        //Puts the statement back into its initial state when we
        //leave, whether the insert worked or not, so it can be
        //reused for the next row.
        struct OnInsertExit {
            OnInsertExit(sqlite3_stmt * prepared_stmt) :
                stmt_(prepared_stmt)
            {}
            ~OnInsertExit() {
                sqlite3_reset(stmt_);
                sqlite3_clear_bindings(stmt_);
            }
        private:
            sqlite3_stmt * stmt_ = nullptr;
        };

        OnInsertExit scoped_exit(stmt);
        (void) scoped_exit;

        int rc = SQLITE_OK;
        auto check_sql = [&rc, &table_name, this]() {
            if (rc != SQLITE_OK) {
                throw DestinationError("Unable to bind a value for table '")
                    << table_name << "': " << sqlite3_errmsg(db_conn_);
            }
        };

        for (int idx = 0; idx < (int)values.size(); ++idx) {
            const int sql_col_idx = idx + 1;
            const OptionalValue & value = values[idx];

            if (!value.isValid()) {
                rc = sqlite3_bind_null(stmt, sql_col_idx);
                check_sql();
                continue;
            }

            const FieldValue & field = value.getValue();
            switch (field.getKind()) {
                case FieldKind::BOOLEAN: {
                    rc = sqlite3_bind_int(stmt, sql_col_idx, field.getBoolean() ? 1 : 0);
                    break;
                }

                case FieldKind::INTEGER: {
                    const sqlite3_int64 val = field.getInteger();
                    rc = sqlite3_bind_int64(stmt, sql_col_idx, val);
                    break;
                }

                case FieldKind::REAL: {
                    rc = sqlite3_bind_double(stmt, sql_col_idx, field.getReal());
                    break;
                }

                case FieldKind::DECIMAL:
                case FieldKind::TEXT: {
                    const std::string & val = (field.getKind() == FieldKind::TEXT) ?
                        field.getText() : field.getDecimal();
                    rc = sqlite3_bind_text(stmt, sql_col_idx, val.c_str(),
                                           (int)val.size(), SQLITE_TRANSIENT);
                    break;
                }

                case FieldKind::BLOB: {
                    const std::vector<uint8_t> & bytes = field.getBlob();
                    if (bytes.empty()) {
                        //A null data pointer would bind NULL, not an empty blob
                        rc = sqlite3_bind_zeroblob(stmt, sql_col_idx, 0);
                    } else {
                        rc = sqlite3_bind_blob(stmt, sql_col_idx, bytes.data(),
                                               (int)bytes.size(), SQLITE_TRANSIENT);
                    }
                    break;
                }
            }
            check_sql();
        }

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            throw DestinationError("Insert into table '") << table_name
                << "' failed: " << sqlite3_errmsg(db_conn_);
        }
    }

private:
    //! Get the cached INSERT statement for this table, preparing
    //! it on first use:
    //!     INSERT INTO 'Customers' VALUES (?, ?, ?)
    sqlite3_stmt * getInsertStatement_(const std::string & table_name,
                                       const size_t num_values)
    {
        auto iter = insert_stmts_.find(table_name);
        if (iter == insert_stmts_.end()) {
            std::vector<std::string> placeholders(num_values, "?");
            const std::string command = "INSERT INTO " + escapeIdentifier(table_name) +
                " VALUES (" + utils::joinCommaSeparated(placeholders) + ")";

            sqlite3_stmt * stmt = nullptr;
            if (sqlite3_prepare_v2(db_conn_, command.c_str(), -1, &stmt, 0) != SQLITE_OK) {
                std::string reason = sqlite3_errmsg(db_conn_);
                sqlite3_finalize(stmt);
                throw DestinationError("Malformed SQL command: '") << command
                    << "': " << reason;
            }

            if (debug_) {
                debug_ << "Prepared " << command;
            }
            iter = insert_stmts_.emplace(table_name, stmt).first;
        }

        sqlite3_stmt * stmt = iter->second;
        if (sqlite3_bind_parameter_count(stmt) != (int)num_values) {
            throw DestinationError("Table '") << table_name << "' takes "
                << sqlite3_bind_parameter_count(stmt) << " values per row, but "
                << num_values << " were given";
        }
        return stmt;
    }

    //! Filename of the database
    const std::string db_file_;

    //! Physical database connection
    sqlite3 * db_conn_ = nullptr;

    //! Cached INSERT statement, one per table
    std::unordered_map<std::string, sqlite3_stmt*> insert_stmts_;

    log::MessageSource debug_{"export.destination", log::categories::DEBUG_STR};
};

SQLiteDestination::SQLiteDestination(const std::string & db_file) :
    impl_(new SQLiteDestination::Impl(db_file))
{
}

SQLiteDestination::~SQLiteDestination()
{
}

const std::string & SQLiteDestination::getDatabaseFilename() const
{
    return impl_->getDatabaseFilename();
}

void SQLiteDestination::setSpaceReclaiming(const bool enabled)
{
    impl_->evalSql(enabled ? "PRAGMA auto_vacuum = FULL" : "PRAGMA auto_vacuum = NONE");
}

void SQLiteDestination::beginTransaction()
{
    impl_->evalSql("BEGIN TRANSACTION");
}

void SQLiteDestination::commitTransaction()
{
    impl_->evalSql("COMMIT TRANSACTION");
}

void SQLiteDestination::rollbackTransaction()
{
    //SQLite may already have rolled back on its own after
    //some errors (SQLITE_FULL, SQLITE_IOERR, ...)
    if (impl_->inTransaction()) {
        impl_->evalSql("ROLLBACK TRANSACTION");
    }
}

bool SQLiteDestination::inTransaction() const
{
    return impl_->inTransaction();
}

void SQLiteDestination::executeDDL(const std::string & statement)
{
    impl_->evalSql(statement);
}

void SQLiteDestination::insert(const std::string & table_name,
                               const Row & values)
{
    impl_->insert(table_name, values);
}

void SQLiteDestination::evalSelect(const std::string & command,
                                   int (*callback)(void *, int, char **, char **),
                                   void * callback_obj) const
{
    impl_->evalSqlSelect(command, callback, callback_obj);
}

} // namespace mdb2sqlite
