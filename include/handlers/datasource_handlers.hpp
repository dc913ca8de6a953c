#pragma once

#include <boost/json.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "engine/datasource.hpp"
#include "handlers/i_handler.hpp"
#include "sshprom_common.hpp"

namespace sshprom {

// Shared plumbing for the subcommands that drive a Datasource: option
// parsing from the leftover CLI tokens and JSON output on stdout.
class DatasourceHandler : public IHandler {
public:
  DatasourceHandler(Datasource &datasource, CliCtx &cli_ctx, std::ostream &out)
      : datasource_(datasource), cli_ctx_(cli_ctx), out_(out) {}

protected:
  po::variables_map
  parse_options(const po::options_description &desc,
                const po::positional_options_description &positional) const;
  void emit(const boost::json::value &jv) const;
  int emit_error(const std::exception &ex) const;
  int emit_list(const std::vector<std::string> &items) const;

  Datasource &datasource_;
  CliCtx &cli_ctx_;
  std::ostream &out_;
};

class HealthHandler : public DatasourceHandler {
public:
  using DatasourceHandler::DatasourceHandler;
  std::string command() const override { return "health"; }
  int start() override;
};

class TestSshHandler : public DatasourceHandler {
public:
  using DatasourceHandler::DatasourceHandler;
  std::string command() const override { return "test-ssh"; }
  int start() override;
};

class QueryHandler : public DatasourceHandler {
public:
  using DatasourceHandler::DatasourceHandler;
  std::string command() const override { return "query"; }
  int start() override;
};

class MetricsHandler : public DatasourceHandler {
public:
  using DatasourceHandler::DatasourceHandler;
  std::string command() const override { return "metrics"; }
  int start() override;
};

class LabelsHandler : public DatasourceHandler {
public:
  using DatasourceHandler::DatasourceHandler;
  std::string command() const override { return "labels"; }
  int start() override;
};

class LabelValuesHandler : public DatasourceHandler {
public:
  using DatasourceHandler::DatasourceHandler;
  std::string command() const override { return "label-values"; }
  int start() override;
};

class FindHandler : public DatasourceHandler {
public:
  using DatasourceHandler::DatasourceHandler;
  std::string command() const override { return "find"; }
  int start() override;
};

class ResourceHandler : public DatasourceHandler {
public:
  using DatasourceHandler::DatasourceHandler;
  std::string command() const override { return "resource"; }
  int start() override;
};

struct SubcommandUsage {
  const char *name;
  const char *args;
  const char *summary;
};

// Every subcommand MakeDatasourceHandlerFactory registers, for help output.
const std::vector<SubcommandUsage> &DatasourceSubcommands();

// Maps subcommand names to handlers bound to one datasource.
std::unique_ptr<IHandlerFactory>
MakeDatasourceHandlerFactory(Datasource &datasource, CliCtx &cli_ctx,
                             std::ostream &out);

} // namespace sshprom
