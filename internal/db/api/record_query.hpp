#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "internal/db/model/record.hpp"

namespace archstore::db {

/*
  Set-based record predicate.

  All present criteria are combined with AND. Translated to SQL by the
  backend; used for fetches and batch update/delete alike.
*/
struct RecordQuery {
  std::optional<std::string> entity;
  std::optional<std::string> project_id;

  // field == value
  std::optional<std::pair<std::string, model::FieldValue>> field_equals;

  // keyset paging: id > after_id, ordered by id
  std::optional<std::string> after_id;
  std::optional<std::size_t> limit;

  static RecordQuery ForEntity(std::string entity) {
    RecordQuery query;
    query.entity = std::move(entity);
    return query;
  }

  static RecordQuery ForProject(std::string project_id) {
    RecordQuery query;
    query.project_id = std::move(project_id);
    return query;
  }

  RecordQuery& Where(std::string field, model::FieldValue value) {
    field_equals = std::make_pair(std::move(field), std::move(value));
    return *this;
  }
};

} // namespace archstore::db
