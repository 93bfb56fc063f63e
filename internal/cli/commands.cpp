#include "commands.hpp"

#include <cstdlib>
#include <map>
#include <set>

#include "internal/core/config_store.hpp"
#include "internal/display/format.hpp"
#include "internal/export/export_writer.hpp"
#include "internal/model/origin_status.hpp"
#include "internal/model/purge_type.hpp"
#include "internal/model/rule_type.hpp"
#include "internal/observability/logging.hpp"

namespace cdn::cli {

using namespace cdn::manager::v1;
using cdn::display::ansi::kGreen;
using cdn::display::ansi::kBold;
using cdn::display::ansi::kReset;
using cdn::display::ansi::kYellow;
using cdn::observability::StringField;

namespace {

/*
  Splits command arguments into positionals and --flags.

  Accepts "--flag value" and "--flag=value". Flags not declared
  by the command are usage errors.
*/
class CommandArgs {
 public:
  CommandArgs(const std::vector<std::string>& args, std::size_t first, const std::set<std::string>& value_flags,
              const std::set<std::string>& switches = {}) {
    for (std::size_t i = first; i < args.size(); ++i) {
      const auto& arg = args[i];
      if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
        positionals_.push_back(arg);
        continue;
      }

      auto        eq   = arg.find('=');
      std::string name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);

      if (switches.count(name)) {
        if (eq != std::string::npos) throw UsageError("--" + name + " takes no value");
        switches_.insert(name);
        continue;
      }
      if (!value_flags.count(name)) {
        throw UsageError("unknown option --" + name);
      }

      if (eq != std::string::npos) {
        values_[name] = arg.substr(eq + 1);
      } else if (i + 1 < args.size()) {
        values_[name] = args[++i];
      } else {
        throw UsageError("--" + name + " requires a value");
      }
    }
  }

  const std::vector<std::string>& Positionals() const {
    return positionals_;
  }

  void ExpectPositionals(std::size_t min, std::size_t max, const char* synopsis) const {
    if (positionals_.size() < min || positionals_.size() > max) {
      throw UsageError(std::string("usage: cdnctl ") + synopsis);
    }
  }

  std::optional<std::string> Value(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    return it->second;
  }

  bool Has(const std::string& name) const {
    return switches_.count(name) > 0;
  }

 private:
  std::vector<std::string>           positionals_;
  std::map<std::string, std::string> values_;
  std::set<std::string>              switches_;
};

int64_t ParseInteger(const std::string& value, const char* what) {
  std::size_t consumed = 0;
  int64_t     parsed   = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw UsageError(std::string("invalid ") + what + ": '" + value + "'");
  }
  if (consumed != value.size()) {
    throw UsageError(std::string("invalid ") + what + ": '" + value + "'");
  }
  return parsed;
}

int64_t ParseOriginId(const std::string& value) {
  auto id = ParseInteger(value, "origin id");
  if (id <= 0) {
    throw UsageError("invalid origin id: '" + value + "'");
  }
  return id;
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

void RunList(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(0, 0, "list [--provider P]");

  auto origins = store.ListOrigins(args.Value("provider"));
  if (origins.empty()) {
    ctx.out << "  " << palette(kYellow) << "No origins registered." << palette(kReset) << "\n\n";
    return;
  }

  ctx.out << "  " << palette(kBold) << "CDN Origins (" << origins.size() << ")" << palette(kReset) << "\n\n";
  for (const auto& origin : origins) {
    display::RenderOrigin(ctx.out, origin, palette);
  }
}

void RunAdd(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(3, 3, "add NAME ORIGIN_URL CDN_URL [--provider P] [--ttl N] [--notes TEXT]");

  core::OriginSpec spec;
  spec.name       = args.Positionals()[0];
  spec.origin_url = args.Positionals()[1];
  spec.cdn_url    = args.Positionals()[2];
  if (auto provider = args.Value("provider")) spec.provider = *provider;
  if (auto ttl = args.Value("ttl")) spec.cache_ttl = ParseInteger(*ttl, "ttl");
  if (auto notes = args.Value("notes")) spec.notes = *notes;

  auto origin = store.AddOrigin(spec);
  ctx.out << "  " << palette(kGreen) << "✓ Origin registered: [" << origin.id() << "] " << origin.name() << palette(kReset) << "\n\n";
}

void RunRule(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(2, 2, "rule ORIGIN_ID PATH_PATTERN [--ttl N] [--type cache|bypass|stream] [--no-cache-headers]");

  core::CacheRuleSpec spec;
  spec.origin_id     = ParseOriginId(args.Positionals()[0]);
  spec.path_pattern  = args.Positionals()[1];
  spec.cache_headers = !args.Has("no-cache-headers");
  if (auto ttl = args.Value("ttl")) spec.ttl = ParseInteger(*ttl, "ttl");
  if (auto type = args.Value("type")) {
    auto parsed = model::ParseRuleType(*type);
    if (!parsed) throw UsageError("invalid rule type: '" + *type + "' (choose cache, bypass or stream)");
    spec.rule_type = *parsed;
  }

  auto rule = store.AddCacheRule(spec);
  ctx.out << "  " << palette(kGreen) << "✓ Rule [" << rule.id() << "]: " << rule.path_pattern() << " → TTL "
          << display::TtlLabel(rule.ttl()) << palette(kReset) << "\n\n";
}

void RunPurge(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(1, 1, "purge ORIGIN_ID [--type full|path|tag] [--target T] [--by ACTOR]");

  core::PurgeSpec spec;
  spec.origin_id = ParseOriginId(args.Positionals()[0]);
  if (auto type = args.Value("type")) {
    auto parsed = model::ParsePurgeType(*type);
    if (!parsed) throw UsageError("invalid purge type: '" + *type + "' (choose full, path or tag)");
    spec.purge_type = *parsed;
  }
  if (auto target = args.Value("target")) spec.target = *target;
  if (auto by = args.Value("by")) spec.triggered_by = *by;

  display::RenderPurgeEvent(ctx.out, store.PurgeCache(spec), palette);
}

void RunStatus(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(0, 0, "status");
  display::RenderStatusSummary(ctx.out, store.CdnStatus(), palette);
}

void RunExport(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(0, 0, "export [--output FILE]");

  const auto path    = args.Value("output").value_or(ctx.default_export_path);
  const auto written = exporter::WriteExport(store.ExportAll(), path);
  ctx.out << "  " << palette(kGreen) << "✓ Exported to: " << written << palette(kReset) << "\n\n";
}

void RunShow(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(1, 1, "show ORIGIN_ID");

  const auto id = ParseOriginId(args.Positionals()[0]);
  display::RenderOrigin(ctx.out, store.GetOrigin(id), palette);

  auto rules = store.ListCacheRules(id);
  if (rules.empty()) {
    return;
  }
  ctx.out << "  " << palette(kBold) << "Cache Rules (" << rules.size() << ")" << palette(kReset) << "\n";
  for (const auto& rule : rules) {
    display::RenderCacheRule(ctx.out, rule, palette);
  }
  ctx.out << "\n";
}

void RunRules(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(0, 1, "rules [ORIGIN_ID]");

  std::optional<int64_t> origin_id;
  if (!args.Positionals().empty()) {
    origin_id = ParseOriginId(args.Positionals()[0]);
  }

  auto rules = store.ListCacheRules(origin_id);
  if (rules.empty()) {
    ctx.out << "  " << palette(kYellow) << "No cache rules." << palette(kReset) << "\n\n";
    return;
  }

  ctx.out << "  " << palette(kBold) << "Cache Rules (" << rules.size() << ")" << palette(kReset) << "\n\n";
  for (const auto& rule : rules) {
    display::RenderCacheRule(ctx.out, rule, palette);
  }
  ctx.out << "\n";
}

void RunSetStatus(core::ConfigStore& store, const CommandArgs& args, const Context& ctx, const display::Palette& palette) {
  args.ExpectPositionals(2, 2, "set-status ORIGIN_ID active|paused|error");

  const auto id     = ParseOriginId(args.Positionals()[0]);
  auto       status = model::ParseOriginStatus(args.Positionals()[1]);
  if (!status) {
    throw UsageError("invalid status: '" + args.Positionals()[1] + "' (choose active, paused or error)");
  }

  auto origin = store.SetOriginStatus(id, *status);
  ctx.out << "  " << palette(kGreen) << "✓ Origin [" << origin.id() << "] " << origin.name() << " is now " << origin.status()
          << palette(kReset) << "\n\n";
}

void Dispatch(core::ConfigStore& store, const std::vector<std::string>& command, const Context& ctx) {
  const display::Palette palette(ctx.color);
  const auto&            name = command.front();

  if (name == "list") {
    CommandArgs args(command, 1, {"provider"});
    display::RenderBanner(ctx.out, palette);
    return RunList(store, args, ctx, palette);
  }
  if (name == "add") {
    CommandArgs args(command, 1, {"provider", "ttl", "notes"});
    display::RenderBanner(ctx.out, palette);
    return RunAdd(store, args, ctx, palette);
  }
  if (name == "rule") {
    CommandArgs args(command, 1, {"ttl", "type"}, {"no-cache-headers"});
    display::RenderBanner(ctx.out, palette);
    return RunRule(store, args, ctx, palette);
  }
  if (name == "purge") {
    CommandArgs args(command, 1, {"type", "target", "by"});
    display::RenderBanner(ctx.out, palette);
    return RunPurge(store, args, ctx, palette);
  }
  if (name == "status") {
    CommandArgs args(command, 1, {});
    display::RenderBanner(ctx.out, palette);
    return RunStatus(store, args, ctx, palette);
  }
  if (name == "export") {
    CommandArgs args(command, 1, {"output"});
    display::RenderBanner(ctx.out, palette);
    return RunExport(store, args, ctx, palette);
  }
  if (name == "show") {
    CommandArgs args(command, 1, {});
    display::RenderBanner(ctx.out, palette);
    return RunShow(store, args, ctx, palette);
  }
  if (name == "rules") {
    CommandArgs args(command, 1, {});
    display::RenderBanner(ctx.out, palette);
    return RunRules(store, args, ctx, palette);
  }
  if (name == "set-status") {
    CommandArgs args(command, 1, {});
    display::RenderBanner(ctx.out, palette);
    return RunSetStatus(store, args, ctx, palette);
  }

  throw UsageError("unknown command '" + name + "'");
}

} // namespace

GlobalOptions ParseGlobalOptions(const std::vector<std::string>& args) {
  GlobalOptions options;

  std::size_t i = 0;
  for (; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.rfind("-", 0) != 0) {
      break;
    }

    auto take_value = [&](const std::string& flag) -> std::string {
      const auto prefix = flag + "=";
      if (arg.rfind(prefix, 0) == 0) {
        return arg.substr(prefix.size());
      }
      if (i + 1 >= args.size()) {
        throw UsageError(flag + " requires a value");
      }
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "--no-color") {
      options.color = false;
    } else if (arg == "--memory") {
      options.memory = true;
    } else if (arg == "--config" || arg.rfind("--config=", 0) == 0) {
      options.config_path = take_value("--config");
    } else if (arg == "--db" || arg.rfind("--db=", 0) == 0) {
      options.db_path = take_value("--db");
    } else {
      throw UsageError("unknown option " + arg);
    }
  }

  if (options.memory && options.db_path) {
    throw UsageError("--memory and --db are mutually exclusive");
  }

  options.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
  return options;
}

bool ResolveColor(bool requested) {
  const char* no_color = std::getenv("NO_COLOR");
  return requested && !(no_color && *no_color);
}

void PrintUsage(std::ostream& out) {
  out << "Usage:\n"
      << "  cdnctl [--config FILE] [--db PATH] [--memory] [--no-color] COMMAND ...\n"
      << "\n"
      << "Commands:\n"
      << "  list       [--provider P]\n"
      << "  add        NAME ORIGIN_URL CDN_URL [--provider P] [--ttl N] [--notes TEXT]\n"
      << "  rule       ORIGIN_ID PATH_PATTERN [--ttl N] [--type cache|bypass|stream] [--no-cache-headers]\n"
      << "  purge      ORIGIN_ID [--type full|path|tag] [--target T] [--by ACTOR]\n"
      << "  status\n"
      << "  export     [--output FILE]\n"
      << "  show       ORIGIN_ID\n"
      << "  rules      [ORIGIN_ID]\n"
      << "  set-status ORIGIN_ID active|paused|error\n";
}

int Execute(core::ConfigStore& store, const std::vector<std::string>& command, const Context& ctx) {
  if (command.empty()) {
    PrintUsage(ctx.err);
    return kExitUsage;
  }

  try {
    Dispatch(store, command, ctx);
    return kExitOk;
  } catch (const UsageError& e) {
    ctx.err << "error: " << e.what() << "\n";
    PrintUsage(ctx.err);
    return kExitUsage;
  } catch (const std::exception& e) {
    CDN_LOG_ERROR("command failed", {StringField("command", command.front()), StringField("error", e.what())});
    ctx.err << "error: " << e.what() << "\n";
    return kExitStoreError;
  }
}

} // namespace cdn::cli
