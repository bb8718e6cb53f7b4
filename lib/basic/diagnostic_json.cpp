// flowsema/basic/diagnostic_json.cpp - Machine-readable diagnostic output
#include "flowsema/basic/diagnostic_json.hpp"

#include <string>

namespace flowsema
{
namespace
{

using nlohmann::json;

json range_to_json(const FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

}  // namespace

json to_json(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange range = diag.primary_range();

  json item;
  item["code"] = diag.code;
  item["severity"] = std::string(to_string(diag.severity));
  item["message"] = diag.message;
  item["args"] = diag.args;

  if (range.is_valid()) {
    item["file"] = sources.get_path(range.file_id()).generic_string();
    item["range"] = range_to_json(sources.get_full_range(range));
    if (!sources.get_file(range.file_id())) {
      // Unregistered file: offsets only
      item["range"]["startByte"] = range.get_begin().offset();
      item["range"]["endByte"] = range.get_end().offset();
    }
  } else {
    item["file"] = nullptr;
    item["range"] = nullptr;
  }

  if (diag.help_message) {
    item["help"] = *diag.help_message;
  }
  return item;
}

json to_json(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  json list = json::array();
  size_t warnings = 0;
  for (const auto & diag : diags) {
    list.push_back(to_json(diag, sources));
    if (diag.severity == Severity::Warning) ++warnings;
  }
  return json{
    {"diagnostics", std::move(list)},
    {"errors", diags.error_count()},
    {"warnings", warnings},
  };
}

}  // namespace flowsema
