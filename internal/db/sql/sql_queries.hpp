#pragma once

namespace kbsync::db::sql {

/*
  Canonical ledger SQL.

  Every document SELECT lists the same columns in the same order (id
  first, knowledge_id last), and so does every run SELECT, so one row
  reader serves each table.
*/

static constexpr const char* INSERT_DOCUMENT =
    "INSERT INTO document_status_table(filename,filepath,file_status,created_at,last_modified_time,process_at,finish_at,failed_msg,"
    "file_size,file_hash,file_store_path,knowledge_id)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_DOCUMENT_BY_ID =
    "SELECT id,filename,filepath,file_status,created_at,last_modified_time,process_at,finish_at,failed_msg,file_size,file_hash,"
    "file_store_path,knowledge_id FROM document_status_table WHERE id=?;";

static constexpr const char* SELECT_DOCUMENT_BY_PATH =
    "SELECT id,filename,filepath,file_status,created_at,last_modified_time,process_at,finish_at,failed_msg,file_size,file_hash,"
    "file_store_path,knowledge_id FROM document_status_table WHERE filepath=?;";

static constexpr const char* UPDATE_DOCUMENT =
    "UPDATE document_status_table SET filename=?,filepath=?,file_status=?,created_at=?,last_modified_time=?,process_at=?,finish_at=?,"
    "failed_msg=?,file_size=?,file_hash=?,file_store_path=?,knowledge_id=?"
    " WHERE id=?;";

// filter / order / limit are appended by the repository
static constexpr const char* SELECT_DOCUMENTS =
    "SELECT id,filename,filepath,file_status,created_at,last_modified_time,process_at,finish_at,failed_msg,file_size,file_hash,"
    "file_store_path,knowledge_id FROM document_status_table";

static constexpr const char* COUNT_DOCUMENTS = "SELECT COUNT(*) FROM document_status_table";

static constexpr const char* COUNT_BY_STATUS =
    "SELECT file_status, COUNT(*) FROM document_status_table GROUP BY file_status ORDER BY file_status;";

// runs

static constexpr const char* INSERT_RUN =
    "INSERT INTO script_process_record(script_name,process_duration,process_count,insert_count,update_count,delete_count,"
    "process_timestamp,status,failed_reason)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_RUNS =
    "SELECT id,script_name,process_duration,process_count,insert_count,update_count,delete_count,process_timestamp,status,failed_reason"
    " FROM script_process_record";

} // namespace kbsync::db::sql
