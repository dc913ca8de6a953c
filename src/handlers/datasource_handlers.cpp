#include "handlers/datasource_handlers.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <type_traits>

#include "proxy_error.hpp"
#include "util/string_util.hpp"

namespace sshprom {
namespace json = boost::json;

namespace {

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

json::object response_to_json(const ResourceResponse &res) {
  json::object headers;
  for (const auto &[name, value] : res.headers) {
    headers[name] = value;
  }
  json::object out{{"status", res.status}, {"headers", std::move(headers)}};
  json::error_code ec;
  auto body = json::parse(res.body, ec);
  if (!ec) {
    out["body"] = std::move(body);
  } else {
    out["body"] = res.body;
  }
  return out;
}

} // namespace

po::variables_map DatasourceHandler::parse_options(
    const po::options_description &desc,
    const po::positional_options_description &positional) const {
  po::variables_map vm;
  auto args = cli_ctx_.subcommand_tokens({command()});
  po::store(po::command_line_parser(args)
                .options(desc)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);
  return vm;
}

void DatasourceHandler::emit(const json::value &jv) const {
  out_ << json::serialize(jv) << std::endl;
}

int DatasourceHandler::emit_error(const std::exception &ex) const {
  json::object err{{"error", ex.what()}};
  if (const auto *proxy = dynamic_cast<const ProxyError *>(&ex)) {
    err["kind"] = to_string(proxy->kind());
    err["code"] = proxy->code();
  }
  emit(err);
  return EXIT_FAILURE;
}

int DatasourceHandler::emit_list(const std::vector<std::string> &items) const {
  json::array arr;
  for (const auto &item : items) {
    arr.emplace_back(item);
  }
  emit(arr);
  return EXIT_SUCCESS;
}

int HealthHandler::start() {
  auto result = datasource_.CheckHealth();
  emit(json::object{{"status", result.ok ? "ok" : "error"},
                    {"message", result.message}});
  return result.ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

int TestSshHandler::start() {
  ResourceRequest req;
  req.path = "test-ssh";
  auto res = datasource_.CallResource(req);
  json::error_code ec;
  auto body = json::parse(res.body, ec);
  if (ec) {
    out_ << res.body << std::endl;
    return EXIT_FAILURE;
  }
  emit(body);
  const auto *status = body.is_object() ? body.as_object().if_contains("status")
                                        : nullptr;
  return status && status->is_string() && status->as_string() == "ok"
             ? EXIT_SUCCESS
             : EXIT_FAILURE;
}

int QueryHandler::start() {
  QuerySpec spec;
  std::int64_t since_seconds = 3600;
  std::int64_t from_ms = 0;
  std::int64_t to_ms = 0;

  po::options_description desc("query options");
  desc.add_options()                                              //
      ("expr", po::value<std::string>(&spec.expr), "PromQL expression") //
      ("legend", po::value<std::string>(&spec.legend_format),
       "legend template, e.g. {{instance}}")                       //
      ("instant", po::bool_switch(&spec.instant), "instant query") //
      ("interval", po::value<std::string>(&spec.interval),
       "step such as 30s, 5m, 1h")                                 //
      ("from", po::value<std::int64_t>(&from_ms),
       "range start in epoch milliseconds")                        //
      ("to", po::value<std::int64_t>(&to_ms),
       "range end in epoch milliseconds, defaults to now")         //
      ("since", po::value<std::int64_t>(&since_seconds)->default_value(3600),
       "range length in seconds when --from is not given")         //
      ("max-points",
       po::value<std::int64_t>(&spec.max_data_points)->default_value(1000),
       "maximum data points per series")                           //
      ("ref-id", po::value<std::string>(&spec.ref_id)->default_value("A"),
       "reference id echoed in the result");
  po::positional_options_description positional;
  positional.add("expr", 1);

  try {
    parse_options(desc, positional);
  } catch (const std::exception &ex) {
    return emit_error(ex);
  }
  if (to_ms == 0) {
    to_ms = now_ms();
  }
  if (from_ms == 0) {
    from_ms = to_ms - since_seconds * 1000;
  }
  spec.time_range = TimeRange{from_ms, to_ms};
  spec.range = !spec.instant;

  auto results = datasource_.QueryData({spec});
  json::array out;
  bool all_ok = true;
  for (const auto &result : results) {
    json::object entry{{"refId", result.ref_id}, {"status", result.status}};
    if (!result.ok()) {
      entry["error"] = result.error;
      all_ok = false;
    }
    entry["frames"] = json::value_from(result.frames);
    out.push_back(std::move(entry));
  }
  emit(json::object{{"results", std::move(out)}});
  return all_ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

int MetricsHandler::start() {
  std::string filter;
  po::options_description desc("metrics options");
  desc.add_options()("filter", po::value<std::string>(&filter),
                     "regex or substring filter over metric names");
  po::positional_options_description positional;
  positional.add("filter", 1);
  try {
    parse_options(desc, positional);
    return emit_list(datasource_.Metrics(filter));
  } catch (const std::exception &ex) {
    return emit_error(ex);
  }
}

int LabelsHandler::start() {
  try {
    return emit_list(datasource_.LabelNames());
  } catch (const std::exception &ex) {
    return emit_error(ex);
  }
}

int LabelValuesHandler::start() {
  std::string label;
  std::string match;
  po::options_description desc("label-values options");
  desc.add_options()                                         //
      ("label", po::value<std::string>(&label)->required(), "label name") //
      ("match", po::value<std::string>(&match),
       "restrict values to series of this metric");
  po::positional_options_description positional;
  positional.add("label", 1);
  try {
    parse_options(desc, positional);
    return emit_list(datasource_.LabelValues(label, match));
  } catch (const std::exception &ex) {
    return emit_error(ex);
  }
}

int FindHandler::start() {
  std::vector<std::string> words;
  po::options_description desc("find options");
  desc.add_options()("query", po::value<std::vector<std::string>>(&words),
                     "metric find query, e.g. label_values(up, job)");
  po::positional_options_description positional;
  positional.add("query", -1);
  try {
    parse_options(desc, positional);
    std::string query;
    for (const auto &w : words) {
      if (!query.empty()) {
        query += ' ';
      }
      query += w;
    }
    return emit_list(datasource_.MetricFindQuery(query));
  } catch (const std::exception &ex) {
    return emit_error(ex);
  }
}

int ResourceHandler::start() {
  ResourceRequest req;
  std::vector<std::string> headers;
  po::options_description desc("resource options");
  desc.add_options()                                                    //
      ("method", po::value<std::string>(&req.method)->required(), "HTTP method") //
      ("path", po::value<std::string>(&req.path)->required(),
       "path relative to the Prometheus base URL")                      //
      ("body", po::value<std::string>(&req.body), "request body")       //
      ("header,H", po::value<std::vector<std::string>>(&headers),
       "extra header as 'Name: value', repeatable");
  po::positional_options_description positional;
  positional.add("method", 1).add("path", 1).add("body", 1);
  try {
    parse_options(desc, positional);
  } catch (const std::exception &ex) {
    return emit_error(ex);
  }
  for (const auto &h : headers) {
    const auto colon = h.find(':');
    if (colon == std::string::npos) {
      return emit_error(std::invalid_argument(
          fmt::format("header '{}' is not in 'Name: value' form", h)));
    }
    req.headers.emplace_back(stringutil::trim_copy(h.substr(0, colon)),
                             stringutil::trim_copy(h.substr(colon + 1)));
  }
  auto res = datasource_.CallResource(req);
  emit(response_to_json(res));
  return res.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

const std::vector<SubcommandUsage> &DatasourceSubcommands() {
  static const std::vector<SubcommandUsage> kSubcommands{
      {"health", "", "Check tunnel and Prometheus."},
      {"test-ssh", "", "Authenticate over SSH only."},
      {"query", "<expr> [--instant] [--legend T] [--interval 1m] [--from MS] "
                "[--to MS] [--since S] [--max-points N]",
       "Run one query and print its frames."},
      {"metrics", "[filter]", "List metric names."},
      {"labels", "", "List label names."},
      {"label-values", "<label> [--match metric]", "List values of a label."},
      {"find", "<query>", "Run a metric find query."},
      {"resource", "<method> <path> [body] [-H 'Name: value']",
       "Relay one request to the Prometheus API."},
  };
  return kSubcommands;
}

std::unique_ptr<IHandlerFactory>
MakeDatasourceHandlerFactory(Datasource &datasource, CliCtx &cli_ctx,
                             std::ostream &out) {
  auto registry = std::make_unique<HandlerRegistry>();
  auto bind = [&](auto tag) {
    using Handler = typename decltype(tag)::type;
    return [&datasource, &cli_ctx, &out]() -> std::shared_ptr<IHandler> {
      return std::make_shared<Handler>(datasource, cli_ctx, out);
    };
  };
  registry->add("health", bind(std::type_identity<HealthHandler>{}))
      .add("test-ssh", bind(std::type_identity<TestSshHandler>{}))
      .add("query", bind(std::type_identity<QueryHandler>{}))
      .add("metrics", bind(std::type_identity<MetricsHandler>{}))
      .add("labels", bind(std::type_identity<LabelsHandler>{}))
      .add("label-values", bind(std::type_identity<LabelValuesHandler>{}))
      .add("find", bind(std::type_identity<FindHandler>{}))
      .add("resource", bind(std::type_identity<ResourceHandler>{}));
  return registry;
}

} // namespace sshprom
