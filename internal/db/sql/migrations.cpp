#include "migrations.hpp"

namespace kbsync::db::sql {

const std::vector<std::string>& LedgerSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS document_status_table ("
      "id INTEGER PRIMARY KEY, "
      "filename TEXT, filepath TEXT UNIQUE, "
      "file_status TEXT, "
      "created_at DATETIME, last_modified_time REAL, "
      "process_at DATETIME, finish_at DATETIME, "
      "failed_msg TEXT, file_size INTEGER, file_hash TEXT, "
      "file_store_path TEXT, knowledge_id TEXT);",

      "CREATE TABLE IF NOT EXISTS script_process_record ("
      "id INTEGER PRIMARY KEY, script_name TEXT, "
      "process_duration REAL, process_count INTEGER, "
      "insert_count INTEGER, update_count INTEGER, delete_count INTEGER, "
      "process_timestamp DATETIME, status TEXT, failed_reason TEXT);",

      "CREATE INDEX IF NOT EXISTS idx_document_status_file_status ON document_status_table(file_status);",
      "CREATE INDEX IF NOT EXISTS idx_document_status_knowledge_id ON document_status_table(knowledge_id);",
      "CREATE INDEX IF NOT EXISTS idx_document_status_created_at ON document_status_table(created_at);",
      "CREATE INDEX IF NOT EXISTS idx_script_process_record_name ON script_process_record(script_name);",
  };
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace kbsync::db::sql
