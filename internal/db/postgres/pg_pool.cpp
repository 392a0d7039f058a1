#include "pg_pool.hpp"

namespace upload::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_session",
               "SELECT id,tenant_id,brand_id,client_reference,batch_reference,transfer_type,expected_size_bytes,uploaded_size_bytes,"
               "multipart_upload_id,part_size_bytes,total_parts,mode,target_asset_id,status,expires_at_ms,last_activity_at_ms,"
               "failure_reason,failure_count,escalation_ticket_id,bucket,object_key,file_name,mime_type,created_at_ms,updated_at_ms "
               "FROM upload_sessions WHERE id=$1");

  conn.prepare("get_session_for_update",
               "SELECT id,tenant_id,brand_id,client_reference,batch_reference,transfer_type,expected_size_bytes,uploaded_size_bytes,"
               "multipart_upload_id,part_size_bytes,total_parts,mode,target_asset_id,status,expires_at_ms,last_activity_at_ms,"
               "failure_reason,failure_count,escalation_ticket_id,bucket,object_key,file_name,mime_type,created_at_ms,updated_at_ms "
               "FROM upload_sessions WHERE id=$1 FOR UPDATE");

  conn.prepare("find_asset_by_session",
               "SELECT id,tenant_id,brand_id,upload_session_id,bucket,object_key,original_file_name,title,mime_type,size_bytes,"
               "asset_class,category_id,visibility,approval,published_at_ms,published_by,created_by,created_at_ms,updated_at_ms,deleted_at_ms "
               "FROM assets WHERE upload_session_id=$1 AND deleted_at_ms IS NULL");

  conn.prepare("get_asset",
               "SELECT id,tenant_id,brand_id,upload_session_id,bucket,object_key,original_file_name,title,mime_type,size_bytes,"
               "asset_class,category_id,visibility,approval,published_at_ms,published_by,created_by,created_at_ms,updated_at_ms,deleted_at_ms "
               "FROM assets WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace upload::db::postgres
