#include "snapshot_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace archstore::history {

using db::model::Record;

namespace {

void FillFields(const db::model::FieldMap& fields, google::protobuf::RepeatedPtrField<archstore::v1::Field>* out) {
  for (const auto& [name, value] : fields) {
    auto* field = out->Add();
    field->set_name(name);
    *field->mutable_value() = ToProto(value);
  }
}

void FillState(const Record& record, archstore::v1::RecordState* state, bool with_fields) {
  state->set_id(record.id);
  state->set_entity(record.entity);
  state->set_project_id(record.project_id);
  if (with_fields) FillFields(record.fields, state->mutable_fields());
  for (const auto& relationship : record.relationships) {
    auto* ref = state->add_relationships();
    ref->set_name(relationship.name);
    ref->set_target_id(relationship.target_id);
    ref->set_owning(relationship.owning);
  }
}

Record FromState(const archstore::v1::RecordState& state) {
  Record record;
  record.id         = state.id();
  record.entity     = state.entity();
  record.project_id = state.project_id();
  for (const auto& field : state.fields()) record.fields[field.name()] = FromProto(field.value());
  for (const auto& ref : state.relationships()) record.relationships.push_back({ref.name(), ref.target_id(), ref.owning()});
  return record;
}

} // namespace

archstore::v1::FieldValue ToProto(const db::model::FieldValue& value) {
  archstore::v1::FieldValue out;
  if (const auto* v = std::get_if<std::int64_t>(&value)) {
    out.set_int_value(*v);
  } else if (const auto* v = std::get_if<double>(&value)) {
    out.set_double_value(*v);
  } else if (const auto* v = std::get_if<bool>(&value)) {
    out.set_bool_value(*v);
  } else if (const auto* v = std::get_if<std::string>(&value)) {
    out.set_string_value(*v);
  }
  return out;
}

db::model::FieldValue FromProto(const archstore::v1::FieldValue& value) {
  switch (value.kind_case()) {
    case archstore::v1::FieldValue::kIntValue:
      return value.int_value();
    case archstore::v1::FieldValue::kDoubleValue:
      return value.double_value();
    case archstore::v1::FieldValue::kBoolValue:
      return value.bool_value();
    case archstore::v1::FieldValue::kStringValue:
      return value.string_value();
    case archstore::v1::FieldValue::KIND_NOT_SET:
      break;
  }
  return std::monostate{};
}

std::string EncodeProjectSnapshot(const Record& project, std::vector<Record> children, const SnapshotMetadata& metadata) {
  std::sort(children.begin(), children.end(), [](const Record& a, const Record& b) { return a.id < b.id; });

  archstore::v1::ProjectSnapshotPayload payload;
  FillState(project, payload.mutable_project_info(), false);
  FillFields(project.fields, payload.mutable_core_fields());
  for (const auto& child : children) FillState(child, payload.add_child_records(), true);

  auto* meta                  = payload.mutable_metadata();
  *meta->mutable_created_at() = util::ToProto(metadata.created_at);
  meta->set_app_version(metadata.app_version);
  meta->set_schema_version(metadata.schema_version);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) throw util::InvalidState("cannot encode snapshot of project " + project.id + ": " + status.ToString());
  return json;
}

archstore::v1::ProjectSnapshotPayload ParseProjectSnapshot(const std::string& payload) {
  archstore::v1::ProjectSnapshotPayload snapshot;
  auto                                  status = google::protobuf::util::JsonStringToMessage(payload, &snapshot);
  if (!status.ok()) throw util::CorruptionError("malformed snapshot payload: " + status.ToString());
  if (snapshot.project_info().id().empty()) throw util::CorruptionError("snapshot payload has no project");
  return snapshot;
}

std::vector<Record> RecordsFromSnapshot(const archstore::v1::ProjectSnapshotPayload& snapshot) {
  std::vector<Record> records;
  records.reserve(snapshot.child_records_size() + 1);

  auto project = FromState(snapshot.project_info());
  for (const auto& field : snapshot.core_fields()) project.fields[field.name()] = FromProto(field.value());
  records.push_back(std::move(project));

  for (const auto& child : snapshot.child_records()) records.push_back(FromState(child));
  return records;
}

} // namespace archstore::history
