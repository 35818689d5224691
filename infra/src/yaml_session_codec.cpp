#include "infra/yaml_session_codec.h"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace stagehand::infra {

using core::Result;
using core::Session;
using core::StageError;

namespace {

// ---- Encoding ----

void emit_string_map(YAML::Emitter &out,
                     const std::map<std::string, std::string> &values) {
  out << YAML::BeginMap;
  for (const auto &[key, value] : values) {
    out << YAML::Key << key << YAML::Value << value;
  }
  out << YAML::EndMap;
}

void emit_error(YAML::Emitter &out, const StageError &error) {
  out << YAML::BeginMap;
  out << YAML::Key << "kind" << YAML::Value << core::to_string(error.kind);
  out << YAML::Key << "category" << YAML::Value
      << core::to_string(error.category);
  out << YAML::Key << "code" << YAML::Value << error.code;
  out << YAML::Key << "retryable" << YAML::Value << error.retryable;
  out << YAML::Key << "message" << YAML::Value << error.message;
  if (!error.unit_id.empty()) {
    out << YAML::Key << "unit_id" << YAML::Value << error.unit_id;
  }
  out << YAML::Key << "attempts" << YAML::Value << error.attempts;
  if (!error.details.empty()) {
    out << YAML::Key << "details" << YAML::Value;
    emit_string_map(out, error.details);
  }
  out << YAML::EndMap;
}

void emit_optional_ms(YAML::Emitter &out, const char *key,
                      const std::optional<int64_t> &value) {
  if (value.has_value()) {
    out << YAML::Key << key << YAML::Value << *value;
  }
}

// ---- Decoding ----

std::string get_string(const YAML::Node &node, const char *key) {
  const YAML::Node child = node[key];
  if (!child || child.IsNull()) {
    return {};
  }
  return child.as<std::string>();
}

template <typename T>
T get_or(const YAML::Node &node, const char *key, T fallback) {
  const YAML::Node child = node[key];
  if (!child || child.IsNull()) {
    return fallback;
  }
  return child.as<T>();
}

std::optional<int64_t> get_optional_ms(const YAML::Node &node, const char *key) {
  const YAML::Node child = node[key];
  if (!child || child.IsNull()) {
    return std::nullopt;
  }
  return child.as<int64_t>();
}

std::map<std::string, std::string> get_string_map(const YAML::Node &node,
                                                  const char *key) {
  std::map<std::string, std::string> out;
  const YAML::Node child = node[key];
  if (!child || !child.IsMap()) {
    return out;
  }
  for (const auto &entry : child) {
    out[entry.first.as<std::string>()] =
        entry.second.IsNull() ? std::string() : entry.second.as<std::string>();
  }
  return out;
}

StageError decode_error(const YAML::Node &node) {
  StageError error;
  error.kind = core::error_kind_from_string(get_string(node, "kind"));
  error.category = core::error_category_from_string(get_string(node, "category"));
  error.code = get_or<int>(node, "code", 0);
  error.retryable = get_or<bool>(node, "retryable", false);
  error.message = get_string(node, "message");
  error.unit_id = get_string(node, "unit_id");
  error.attempts = get_or<int>(node, "attempts", 0);
  error.details = get_string_map(node, "details");
  return error;
}

std::optional<StageError> get_optional_error(const YAML::Node &node,
                                             const char *key) {
  const YAML::Node child = node[key];
  if (!child || !child.IsMap()) {
    return std::nullopt;
  }
  return decode_error(child);
}

StageError corrupt(const std::string &why) {
  return StageError(core::ErrorKind::Store, core::ErrorCategory::Store, 4004,
                    false, "Corrupt session document: " + why);
}

} // namespace

std::string YamlSessionCodec::encode(const Session &session) const {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "session_id" << YAML::Value << session.session_id;
  out << YAML::Key << "created_at_ms" << YAML::Value << session.created_at_ms;
  out << YAML::Key << "updated_at_ms" << YAML::Value << session.updated_at_ms;
  out << YAML::Key << "overall_status" << YAML::Value
      << core::to_string(session.overall_status);
  out << YAML::Key << "revision" << YAML::Value << session.revision;
  out << YAML::Key << "next_event_seq" << YAML::Value << session.next_event_seq;

  const auto &stats = session.statistics;
  out << YAML::Key << "statistics" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "total" << YAML::Value << stats.total;
  out << YAML::Key << "succeeded" << YAML::Value << stats.succeeded;
  out << YAML::Key << "failed" << YAML::Value << stats.failed;
  out << YAML::Key << "skipped" << YAML::Value << stats.skipped;
  out << YAML::Key << "retries" << YAML::Value << stats.retries;
  out << YAML::Key << "circuit_rejections" << YAML::Value
      << stats.circuit_rejections;
  out << YAML::Key << "total_duration_ms" << YAML::Value
      << stats.total_duration_ms;
  out << YAML::EndMap;

  if (session.last_error.has_value()) {
    out << YAML::Key << "last_error" << YAML::Value;
    emit_error(out, *session.last_error);
  }

  out << YAML::Key << "units" << YAML::Value << YAML::BeginMap;
  for (const auto &[id, state] : session.unit_states) {
    out << YAML::Key << id << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "status" << YAML::Value << core::to_string(state.status);
    out << YAML::Key << "attempt_count" << YAML::Value << state.attempt_count;
    emit_optional_ms(out, "started_at_ms", state.started_at_ms);
    emit_optional_ms(out, "finished_at_ms", state.finished_at_ms);
    if (!state.owner.empty()) {
      out << YAML::Key << "owner" << YAML::Value << state.owner;
    }
    emit_optional_ms(out, "heartbeat_at_ms", state.heartbeat_at_ms);
    if (state.last_error.has_value()) {
      out << YAML::Key << "last_error" << YAML::Value;
      emit_error(out, *state.last_error);
    }
    if (!state.outputs.empty()) {
      out << YAML::Key << "outputs" << YAML::Value;
      emit_string_map(out, state.outputs);
    }
    out << YAML::EndMap;
  }
  out << YAML::EndMap;

  out << YAML::Key << "events" << YAML::Value << YAML::BeginSeq;
  for (const auto &event : session.events) {
    out << YAML::BeginMap;
    out << YAML::Key << "seq" << YAML::Value << event.seq;
    out << YAML::Key << "at_ms" << YAML::Value << event.at_ms;
    if (!event.unit_id.empty()) {
      out << YAML::Key << "unit_id" << YAML::Value << event.unit_id;
    }
    out << YAML::Key << "status" << YAML::Value << event.status;
    out << YAML::Key << "attempt" << YAML::Value << event.attempt;
    out << YAML::Key << "message" << YAML::Value << event.message;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

Result<Session, StageError>
YamlSessionCodec::decode(const std::string &payload) const {
  try {
    const YAML::Node root = YAML::Load(payload);
    if (!root.IsMap()) {
      return Result<Session, StageError>::Err(corrupt("root is not a mapping"));
    }

    Session session;
    session.session_id = get_string(root, "session_id");
    session.created_at_ms = get_or<int64_t>(root, "created_at_ms", 0);
    session.updated_at_ms = get_or<int64_t>(root, "updated_at_ms", 0);
    const auto overall =
        core::run_status_from_string(get_string(root, "overall_status"));
    if (!overall.has_value()) {
      return Result<Session, StageError>::Err(corrupt(
          "unknown overall_status '" + get_string(root, "overall_status") + "'"));
    }
    session.overall_status = *overall;
    session.revision = get_or<int64_t>(root, "revision", 0);
    session.next_event_seq = get_or<int64_t>(root, "next_event_seq", 1);

    if (const YAML::Node stats = root["statistics"]; stats && stats.IsMap()) {
      session.statistics.total = get_or<int>(stats, "total", 0);
      session.statistics.succeeded = get_or<int>(stats, "succeeded", 0);
      session.statistics.failed = get_or<int>(stats, "failed", 0);
      session.statistics.skipped = get_or<int>(stats, "skipped", 0);
      session.statistics.retries = get_or<int>(stats, "retries", 0);
      session.statistics.circuit_rejections =
          get_or<int>(stats, "circuit_rejections", 0);
      session.statistics.total_duration_ms =
          get_or<int64_t>(stats, "total_duration_ms", 0);
    }
    session.last_error = get_optional_error(root, "last_error");

    if (const YAML::Node units = root["units"]; units && units.IsMap()) {
      for (const auto &entry : units) {
        const std::string id = entry.first.as<std::string>();
        const YAML::Node node = entry.second;
        const auto status =
            core::unit_status_from_string(get_string(node, "status"));
        if (!status.has_value()) {
          return Result<Session, StageError>::Err(
              corrupt("unit '" + id + "' has unknown status '" +
                      get_string(node, "status") + "'"));
        }
        core::ExecutionState state;
        state.status = *status;
        state.attempt_count = get_or<int>(node, "attempt_count", 0);
        state.started_at_ms = get_optional_ms(node, "started_at_ms");
        state.finished_at_ms = get_optional_ms(node, "finished_at_ms");
        state.owner = get_string(node, "owner");
        state.heartbeat_at_ms = get_optional_ms(node, "heartbeat_at_ms");
        state.last_error = get_optional_error(node, "last_error");
        state.outputs = get_string_map(node, "outputs");
        session.unit_states.emplace(id, std::move(state));
      }
    }

    if (const YAML::Node events = root["events"]; events && events.IsSequence()) {
      session.events.reserve(events.size());
      for (const auto &node : events) {
        core::ProgressEvent event;
        event.seq = get_or<int64_t>(node, "seq", 0);
        event.at_ms = get_or<int64_t>(node, "at_ms", 0);
        event.unit_id = get_string(node, "unit_id");
        event.status = get_string(node, "status");
        event.attempt = get_or<int>(node, "attempt", 0);
        event.message = get_string(node, "message");
        session.events.push_back(std::move(event));
      }
    }
    return Result<Session, StageError>::Ok(std::move(session));
  } catch (const YAML::Exception &e) {
    return Result<Session, StageError>::Err(corrupt(e.what()));
  }
}

} // namespace stagehand::infra
