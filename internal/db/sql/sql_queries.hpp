#pragma once

namespace pagereg::db::sql {

/*
  Canonical SQL used by the SQL backends.

  IMPORTANT:
  Written in the SQLite dialect. Parameters are positional; the column order
  of every SELECT matches the row readers in the backend.
*/

// pages

static constexpr const char* INSERT_PAGE =
    "INSERT INTO pages(id,name,thumbnail,content,immutable,update_fee,ownership_kind,threshold,"
    "balance,retained_remainder,next_request_id,likes,dislikes,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PAGE =
    "SELECT id,name,thumbnail,content,immutable,update_fee,ownership_kind,threshold,"
    "balance,retained_remainder,next_request_id,likes,dislikes,created_at_ms,updated_at_ms"
    " FROM pages WHERE id=?;";

static constexpr const char* UPDATE_PAGE =
    "UPDATE pages SET name=?,thumbnail=?,content=?,immutable=?,update_fee=?,ownership_kind=?,threshold=?,"
    "balance=?,retained_remainder=?,next_request_id=?,likes=?,dislikes=?,created_at_ms=?,updated_at_ms=?"
    " WHERE id=?;";

static constexpr const char* COUNT_PAGES =
    "SELECT COUNT(*) FROM pages;";

// owners

static constexpr const char* DELETE_OWNERS =
    "DELETE FROM page_owners WHERE page_id=?;";

static constexpr const char* INSERT_OWNER =
    "INSERT INTO page_owners(page_id,position,principal) VALUES(?,?,?);";

static constexpr const char* SELECT_OWNERS =
    "SELECT principal FROM page_owners WHERE page_id=? ORDER BY position;";

// update requests

static constexpr const char* INSERT_REQUEST =
    "INSERT INTO update_requests(page_id,request_id,proposer,content,name,thumbnail,executed,approval_count,"
    "created_at_ms,executed_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_REQUEST =
    "SELECT page_id,request_id,proposer,content,name,thumbnail,executed,approval_count,created_at_ms,executed_at_ms"
    " FROM update_requests WHERE page_id=? AND request_id=?;";

static constexpr const char* UPDATE_REQUEST =
    "UPDATE update_requests SET proposer=?,content=?,name=?,thumbnail=?,executed=?,approval_count=?,"
    "created_at_ms=?,executed_at_ms=? WHERE page_id=? AND request_id=?;";

static constexpr const char* INSERT_APPROVAL =
    "INSERT INTO request_approvals(page_id,request_id,position,principal)"
    " VALUES(?1,?2,(SELECT COUNT(*) FROM request_approvals WHERE page_id=?1 AND request_id=?2),?3);";

static constexpr const char* SELECT_APPROVALS =
    "SELECT principal FROM request_approvals WHERE page_id=? AND request_id=? ORDER BY position;";

// participants

static constexpr const char* INSERT_PARTICIPANT =
    "INSERT INTO participants(page_id,position,principal)"
    " VALUES(?1,(SELECT COUNT(*) FROM participants WHERE page_id=?1),?2);";

static constexpr const char* SELECT_PARTICIPANTS =
    "SELECT principal FROM participants WHERE page_id=? ORDER BY position;";

// reactions

static constexpr const char* UPSERT_REACTION =
    "INSERT INTO reactions(page_id,principal,liked,disliked) VALUES(?,?,?,?)"
    " ON CONFLICT(page_id,principal) DO UPDATE SET liked=excluded.liked, disliked=excluded.disliked;";

static constexpr const char* SELECT_REACTION =
    "SELECT page_id,principal,liked,disliked FROM reactions WHERE page_id=? AND principal=?;";

} // namespace pagereg::db::sql
