#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "datalens/v1.hpp"
#include "internal/cli/exit_code.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/query_condition.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

using namespace datalens::v1;

namespace {

using datalens::cli::kExitUsage;

void Usage() {
  std::cerr << "Usage:\n"
            << "  datalens <config.yaml> scan\n"
            << "  datalens <config.yaml> fields <type>\n"
            << "  datalens <config.yaml> query [--any] [--type <type>] \"<field> <op> [value]\"...\n"
            << "  datalens <config.yaml> search <term> [--case-sensitive]\n"
            << "  datalens <config.yaml> orphans [--exclude <type>]...\n"
            << "  datalens <config.yaml> top [n]\n"
            << "  datalens <config.yaml> top-deps [n]\n"
            << "  datalens <config.yaml> refs <id>\n"
            << "  datalens <config.yaml> deps <id>\n"
            << "  datalens <config.yaml> path <from> <to>\n"
            << "  datalens <config.yaml> stats [<id>]\n"
            << "  datalens <config.yaml> reload\n";
}

void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render response: " + std::string(status.message()));
  }
  std::cout << json;
}

RecordID MakeID(const std::string& value) {
  RecordID id;
  id.set_value(value);
  return id;
}

uint32_t ParseCount(const std::string& text) {
  uint32_t   value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw datalens::util::InvalidArgument("expected a non-negative count, got '" + text + "'");
  }
  return value;
}

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::vector<std::string> SplitWords(std::string_view s) {
  std::vector<std::string> words;
  size_t                   i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    const size_t start = i;
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i > start) words.emplace_back(s.substr(start, i - start));
  }
  return words;
}

// Literal typing: "quoted" -> string, null, true/false, integer, float,
// anything else -> string. The comparator coerces to the field's kind.
datalens::model::Value ParseLiteral(std::string_view text) {
  text = Trim(text);
  if (text.empty()) return datalens::model::Value::Null();
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
    return std::string(text.substr(1, text.size() - 2));
  }
  if (text == "null") return datalens::model::Value::Null();
  if (text == "true") return true;
  if (text == "false") return false;

  int64_t integer = 0;
  auto [iptr, iec] = std::from_chars(text.data(), text.data() + text.size(), integer);
  if (iec == std::errc{} && iptr == text.data() + text.size()) return integer;

  double floating = 0;
  auto [fptr, fec] = std::from_chars(text.data(), text.data() + text.size(), floating);
  if (fec == std::errc{} && fptr == text.data() + text.size()) return floating;

  return std::string(text);
}

// "<field> <op> [value]" where op may span up to three words
// ("is not null").
Condition ParseCondition(const std::string& text) {
  const auto words = SplitWords(text);
  if (words.size() < 2) {
    throw datalens::util::InvalidArgument("condition needs a field and an operator: '" + text + "'");
  }

  for (size_t span = std::min<size_t>(3, words.size() - 1); span >= 1; --span) {
    std::string op_text = words[1];
    for (size_t k = 2; k <= span; ++k) op_text += " " + words[k];

    const auto op = datalens::query::ParseOperator(op_text);
    if (!op) continue;

    // value is the raw remainder so quoted strings keep inner spaces
    std::string_view rest = text;
    for (size_t k = 0; k <= span; ++k) {
      rest = Trim(rest);
      rest.remove_prefix(std::min(rest.size(), words[k].size()));
    }

    Condition condition;
    condition.set_field_name(words[0]);
    condition.set_op(datalens::service::ToProto(*op));
    *condition.mutable_value() = datalens::service::ToProto(ParseLiteral(rest));
    return condition;
  }
  throw datalens::util::InvalidArgument("unknown operator in condition: '" + text + "'");
}

int Run(datalens::factory::Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "scan") {
    PrintJson(app.catalog_service->Scan(ScanRequest{}));
    return 0;
  }

  if (cmd == "reload") {
    PrintJson(app.catalog_service->Reload(ReloadRequest{}));
    return 0;
  }

  if (cmd == "fields") {
    if (args.size() != 1) return kExitUsage;
    ListQueryableFieldsRequest req;
    req.set_type_name(args[0]);
    PrintJson(app.query_service->ListQueryableFields(req));
    return 0;
  }

  if (cmd == "query") {
    QueryRequest req;
    for (size_t i = 0; i < args.size(); ++i) {
      if (args[i] == "--any") {
        req.mutable_group()->set_logical_op(LOGICAL_OPERATOR_OR);
      } else if (args[i] == "--type") {
        if (++i >= args.size()) return kExitUsage;
        req.set_type_name(args[i]);
      } else {
        *req.mutable_group()->add_conditions() = ParseCondition(args[i]);
      }
    }
    PrintJson(app.query_service->Query(req));
    return 0;
  }

  if (cmd == "search") {
    if (args.empty()) return kExitUsage;
    SearchByNameRequest req;
    req.set_term(args[0]);
    req.set_case_sensitive(args.size() > 1 && args[1] == "--case-sensitive");
    PrintJson(app.query_service->SearchByName(req));
    return 0;
  }

  if (cmd == "orphans") {
    FindOrphansRequest req;
    for (size_t i = 0; i < args.size(); ++i) {
      if (args[i] != "--exclude" || i + 1 >= args.size()) return kExitUsage;
      req.add_excluded_types(args[++i]);
    }
    PrintJson(app.dependency_service->FindOrphans(req));
    return 0;
  }

  if (cmd == "top" || cmd == "top-deps") {
    RankRequest req;
    if (!args.empty()) req.set_top_n(ParseCount(args[0]));
    PrintJson(cmd == "top" ? app.dependency_service->FindMostReferenced(req) : app.dependency_service->FindMostDependencies(req));
    return 0;
  }

  if (cmd == "refs" || cmd == "deps") {
    if (args.size() != 1) return kExitUsage;
    RecordRequest req;
    *req.mutable_id() = MakeID(args[0]);
    PrintJson(cmd == "refs" ? app.dependency_service->GetReferencers(req) : app.dependency_service->GetDependencies(req));
    return 0;
  }

  if (cmd == "path") {
    if (args.size() != 2) return kExitUsage;
    ShortestPathRequest req;
    *req.mutable_from() = MakeID(args[0]);
    *req.mutable_to()   = MakeID(args[1]);
    PrintJson(app.dependency_service->FindShortestPath(req));
    return 0;
  }

  if (cmd == "stats") {
    if (args.empty()) {
      PrintJson(app.dependency_service->GetGraphStats(GraphStatsRequest{}));
      return 0;
    }
    RecordRequest req;
    *req.mutable_id() = MakeID(args[0]);
    PrintJson(app.dependency_service->GetRecordStats(req));
    return 0;
  }

  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  int rc = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = datalens::config::ConfigLoader::LoadFromYaml(config_path);
    datalens::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application and run one command
    // ------------------------------------------------------------
    auto app = datalens::factory::Build(config);
    rc       = Run(app, cmd, args);
    if (rc == kExitUsage) Usage();
  } catch (const std::exception& e) {
    rc = datalens::cli::ToExitCode(e);
    if (rc == datalens::cli::kExitFatal) {
      DATALENS_LOG_ERROR("Fatal error", {datalens::observability::StringField("error", e.what())});
    } else {
      std::cerr << "error: " << e.what() << "\n";
    }
  }

  datalens::observability::ShutdownLogging();
  return rc;
}
