#include "fhirgate/path/json_navigator.h"

#include "fhirgate/core/normalization.h"

namespace fhirgate::path {

namespace {

using nlohmann::json;

std::string join_path(const std::string& base, const std::string& name) {
  return base.empty() ? name : base + "." + name;
}

std::string indexed(const std::string& path, const std::size_t index) {
  return path + "[" + std::to_string(index) + "]";
}

// Arrays contribute their non-null elements, scalars and objects themselves.
void append_flattened(const json& value, const std::string& path, std::vector<SelectedNode>& out) {
  if (value.is_null()) {
    return;
  }
  if (!value.is_array()) {
    out.push_back({&value, path});
    return;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (!value[i].is_null()) {
      out.push_back({&value[i], indexed(path, i)});
    }
  }
}

void select_choice(const SelectedNode& parent, const PathSegment& segment,
                   std::vector<SelectedNode>& out) {
  const auto& name = segment.name;
  for (auto it = parent.node->begin(); it != parent.node->end(); ++it) {
    const std::string& key = it.key();
    if (key.size() > name.size() && key.starts_with(name) && core::is_ascii_upper(key[name.size()])) {
      append_flattened(it.value(), join_path(parent.path, key), out);
    }
  }
}

void select_indexed(const json& value, const std::string& path, const std::size_t index,
                    std::vector<SelectedNode>& out) {
  if (value.is_array()) {
    if (index < value.size() && !value[index].is_null()) {
      out.push_back({&value[index], indexed(path, index)});
    }
    return;
  }
  // A singleton behaves as a one-element collection.
  if (index == 0 && !value.is_null()) {
    out.push_back({&value, path});
  }
}

}  // namespace

std::vector<SelectedNode> select_nodes(const json& root, const std::vector<PathSegment>& segments,
                                       const std::string& base_path) {
  std::vector<SelectedNode> current{{&root, base_path}};

  for (const auto& segment : segments) {
    std::vector<SelectedNode> next;
    for (const auto& selected : current) {
      if (!selected.node->is_object()) {
        continue;
      }
      if (segment.marker == SegmentMarker::kChoice) {
        select_choice(selected, segment, next);
        continue;
      }

      const auto it = selected.node->find(segment.name);
      if (it == selected.node->end()) {
        continue;
      }
      const std::string child_path = join_path(selected.path, segment.name);
      if (segment.marker == SegmentMarker::kIndex) {
        select_indexed(*it, child_path, segment.index, next);
      } else {
        append_flattened(*it, child_path, next);
      }
    }
    current = std::move(next);
    if (current.empty()) {
      break;
    }
  }

  return current;
}

bool is_empty_value(const json& value) {
  if (value.is_null()) {
    return true;
  }
  if (value.is_string()) {
    return core::trim(value.get_ref<const std::string&>()).empty();
  }
  if (value.is_array() || value.is_object()) {
    return value.empty();
  }
  return false;
}

bool values_equal(const json& value, const json& literal) {
  if (literal.is_string()) {
    return value.is_string() &&
           value.get_ref<const std::string&>() == literal.get_ref<const std::string&>();
  }
  if (literal.is_boolean()) {
    return value.is_boolean() && value.get<bool>() == literal.get<bool>();
  }
  if (literal.is_number()) {
    return value.is_number() && value.get<double>() == literal.get<double>();
  }
  return value == literal;
}

}  // namespace fhirgate::path
