#include "assembler/json_payroll_source.hpp"
#include "assembler/line_assembler.hpp"
#include "audit/audit_trail.hpp"
#include "compliance/compliance_ledger.hpp"
#include "config/config_loader.hpp"
#include "core/money.hpp"
#include "core/utils.hpp"
#include "model/bank_registry.hpp"
#include "model/batch_json.hpp"
#include "reconciliation/json_statement_source.hpp"
#include "reconciliation/payment_reconciler.hpp"
#include "sif/sif_codec.hpp"
#include "store/repositories.hpp"
#include "submission/connector_factory.hpp"
#include "submission/submission_orchestrator.hpp"
#include "validation/reference_data.hpp"
#include "validation/rule_repository.hpp"
#include "validation/validation_engine.hpp"
#include "validation/validation_report.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <unordered_map>

using namespace wpsgate;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInvalid = 2;
constexpr int kExitSubmission = 3;

constexpr const char* kUsage =
    "usage: wpsgate <command> [--config <file>] [options]\n"
    "\n"
    "commands:\n"
    "  assemble --payroll <json> --period <YYYY-MM> --salary-date <YYYY-MM-DD> --out <batch.json>\n"
    "           [--company <id>] [--department <name>] [--file-type sif|non_sif]\n"
    "  validate --batch <json> [--json]\n"
    "  encode   --batch <json> --out <dir>\n"
    "  decode   --file <sif>\n"
    "  submit   --batch <json> --connection <name> [--poll <n>] [--poll-interval-ms <ms>]\n"
    "  reconcile --batch <json> --statement <json> [--from <YYYY-MM-DD>] [--to <YYYY-MM-DD>]\n"
    "\n"
    "common: --config <file> (default wpsgate.toml), --actor <name>\n";

// ============================================================================
// Argument parsing (--key value, --flag)
// ============================================================================

class CliArgs {
public:
    CliArgs(int argc, char* argv[]) {
        if (argc > 1) command_ = argv[1];
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (!arg.starts_with("--")) {
                throw ConfigError(std::format("unexpected argument '{}'", arg));
            }
            arg = arg.substr(2);
            if (i + 1 < argc && !std::string_view(argv[i + 1]).starts_with("--")) {
                values_[arg] = argv[++i];
            } else {
                values_[arg] = "";
            }
        }
    }

    [[nodiscard]] const std::string& command() const { return command_; }
    [[nodiscard]] bool has(const std::string& key) const { return values_.contains(key); }

    [[nodiscard]] std::string get(const std::string& key, const std::string& fallback = {}) const {
        const auto it = values_.find(key);
        return it == values_.end() ? fallback : it->second;
    }

    /// @throws ConfigError when missing
    [[nodiscard]] std::string require(const std::string& key) const {
        const auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            throw ConfigError(std::format("{} requires --{}", command_, key));
        }
        return it->second;
    }

private:
    std::string command_;
    std::unordered_map<std::string, std::string> values_;
};

// ============================================================================
// Shared wiring
// ============================================================================

struct Context {
    AppConfig config;
    std::shared_ptr<DerivedCheckRegistry> checks;
    std::shared_ptr<BankRegistry> banks;
    std::shared_ptr<InMemoryRuleRepository> rules;
    std::shared_ptr<ValidationEngine> engine;
};

Context build_context(const CliArgs& args) {
    Context ctx;
    ctx.checks = DerivedCheckRegistry::with_builtins();

    const auto config_path = args.get("config", "wpsgate.toml");
    auto load = ConfigLoader::load_from_file(config_path, *ctx.checks);
    if (!load.success) {
        throw ConfigError(load.error_message);
    }
    ctx.config = std::move(load.config);

    if (const auto level = utils::log::parse_level(ctx.config.logging.level)) {
        utils::log::set_level(*level);
    }
    if (!ctx.config.logging.file.empty() && !utils::log::set_file(ctx.config.logging.file)) {
        utils::log::warn(std::format("Cannot open log file {}", ctx.config.logging.file));
    }

    ctx.banks = std::make_shared<BankRegistry>(ctx.config.banks);
    auto reference = std::make_shared<InMemoryReferenceData>();
    reference->add_banks(*ctx.banks);

    ctx.rules = std::make_shared<InMemoryRuleRepository>(ctx.config.rules);
    ctx.engine = std::make_shared<ValidationEngine>(ctx.rules, ctx.checks, reference,
                                                    ctx.config.validation.engine);

    utils::log::info(std::format("Loaded {}: {} banks, {} connections, {} rules",
        config_path, ctx.banks->size(), ctx.config.connections.size(), ctx.rules->rule_count()));
    return ctx;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ConfigError(std::format("cannot open {}", path));
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

SalaryPeriod parse_period(const std::string& text) {
    const auto parts = utils::split(text, '-');
    if (parts.size() == 2) {
        const auto year = utils::try_parse_int<int>(parts[0]);
        const auto month = utils::try_parse_int<unsigned>(parts[1]);
        if (year && month) {
            SalaryPeriod period(*month, *year);
            if (period.valid()) return period;
        }
    }
    throw ConfigError(std::format("invalid period '{}' (expected YYYY-MM)", text));
}

// ============================================================================
// Commands
// ============================================================================

int cmd_assemble(const CliArgs& args) {
    auto ctx = build_context(args);
    const auto& employer = ctx.config.employer;

    WpsBatch batch;
    batch.set_company_id(args.get("company", employer.company_id));
    batch.set_employer_id(employer.employer_id);
    batch.set_employer_name(employer.name);
    batch.set_employer_bank_code(employer.bank_routing_code);
    batch.set_employer_account(employer.account);
    batch.set_period(parse_period(args.require("period")));

    const auto salary_date = args.require("salary-date");
    batch.set_salary_date(utils::parse_date(salary_date));
    if (!batch.salary_date()) {
        throw ConfigError(std::format("invalid salary date '{}'", salary_date));
    }

    const auto file_type = parse_file_type(args.get("file-type", "sif"));
    if (!file_type) throw ConfigError("--file-type must be sif or non_sif");
    batch.set_file_type(*file_type);

    EmployerScope scope;
    scope.company_id = batch.company_id();
    scope.employer_id = batch.employer_id();
    if (args.has("department")) scope.department = args.get("department");

    auto source = std::make_shared<JsonPayrollSource>(
        JsonPayrollSource::from_file(args.require("payroll")));
    LineAssembler assembler(source, ctx.banks);

    BatchRepository batches;
    batch.set_reference(batches.next_reference(batch.period()));
    assembler.rebuild(batch, scope);

    const auto out = args.require("out");
    save_batch_file(batch, out);

    const auto totals = batch.totals();
    std::cout << std::format("{}: {} lines, net {} AED -> {}\n", batch.reference(),
        totals.employee_count, money::format_amount(money::round_to_subunits(totals.net)), out);
    return kExitOk;
}

int cmd_validate(const CliArgs& args) {
    auto ctx = build_context(args);
    const auto batch = load_batch_file(args.require("batch"));
    const auto result = ctx.engine->evaluate(batch);

    if (args.has("json")) {
        std::cout << validation_result_to_json(result).dump(2) << '\n';
    } else {
        std::cout << format_validation_summary(result);
    }
    return result.can_submit ? kExitOk : kExitInvalid;
}

int cmd_encode(const CliArgs& args) {
    const auto batch_path = args.require("batch");
    auto batch = load_batch_file(batch_path);

    batch.mark_generated();
    const auto encoded = SifCodec::encode(batch);

    const std::filesystem::path dir(args.require("out"));
    std::filesystem::create_directories(dir);
    const auto path = dir / encoded.file_name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << encoded.content;
    if (!out) throw ConfigError(std::format("cannot write {}", path.string()));

    save_batch_file(batch, batch_path);
    std::cout << std::format("{}: {} records, net {} AED\n", path.string(),
        encoded.record_count, money::format_amount(encoded.total_net_subunits));
    return kExitOk;
}

int cmd_decode(const CliArgs& args) {
    const auto sif = SifCodec::decode(read_file(args.require("file")));
    const auto& h = sif.header;

    std::cout << std::format("EDR employer={} bank={} account={} period={:02d}/{} records={} net={} {}\n",
        h.employer_id, h.bank_routing_code, h.account, h.salary_month, h.salary_year,
        h.total_records, money::format_amount(h.total_net_subunits), h.currency);
    for (const auto& d : sif.details) {
        std::cout << std::format("SDR {:<15} {:<9} {:<34} {} days={:>2} net={}\n",
            d.employee_id, d.bank_routing_code, d.account, utils::format_date(d.salary_date),
            d.days_worked, money::format_amount(d.net_subunits));
    }
    return kExitOk;
}

int cmd_submit(const CliArgs& args) {
    auto ctx = build_context(args);
    const auto batch_path = args.require("batch");
    const auto connection_name = args.require("connection");
    const auto actor = args.get("actor", "cli");

    auto batches = std::make_shared<BatchRepository>();
    const auto batch_reference = batches->add(load_batch_file(batch_path));

    auto connections = std::make_shared<ConnectionRepository>();
    for (const auto& connection : ctx.config.connections) {
        connections->add(connection);
    }

    SubmissionServices services;
    services.batches = batches;
    services.connections = connections;
    services.submissions = std::make_shared<SubmissionRepository>();
    services.validation = ctx.engine;
    services.connectors = std::make_shared<ConnectorFactory>();
    services.compliance = std::make_shared<ComplianceLedger>();
    services.audit = std::make_shared<AuditTrail>(ctx.config.audit);
    services.history = std::make_shared<ValidationHistory>();

    const auto persist = [&] {
        save_batch_file(batches->get(batch_reference), batch_path);
        services.audit->flush();
    };

    const auto polls = utils::parse_int<int>(args.get("poll", "0"));
    const auto interval = std::chrono::milliseconds(
        utils::parse_int<int64_t>(args.get("poll-interval-ms", "5000"), 5000));

    Submission submission;
    {
        SubmissionOrchestrator orchestrator(services, ctx.config.submission);
        try {
            submission = orchestrator.submit_and_follow(batch_reference, connection_name, actor,
                                                        polls, interval);
        } catch (const WpsError&) {
            persist();
            throw;
        }
    }
    persist();

    std::cout << std::format("{}: {} (bank reference '{}', {} attempt(s))\n", submission.reference,
        submission_state_to_string(submission.state()), submission.bank_reference,
        submission.attempts.size());
    if (!submission.last_error.empty()) {
        std::cout << "last error: " << submission.last_error << '\n';
    }

    switch (submission.state()) {
        case SubmissionState::PROCESSING:
        case SubmissionState::SUCCESS:
            return kExitOk;
        default:
            return kExitSubmission;
    }
}

std::chrono::year_month_day date_arg(const CliArgs& args, const std::string& key,
                                     std::chrono::year_month_day fallback) {
    if (!args.has(key)) return fallback;
    const auto text = args.require(key);
    const auto date = utils::parse_date(text);
    if (!date) throw ConfigError(std::format("invalid --{} '{}'", key, text));
    return *date;
}

int cmd_reconcile(const CliArgs& args) {
    auto ctx = build_context(args);
    const auto batch = load_batch_file(args.require("batch"));
    const auto actor = args.get("actor", "cli");

    // Salary is due from the first of the period until the filing deadline
    const auto& period = batch.period();
    const std::chrono::year_month_day period_start{
        std::chrono::year{period.year}, std::chrono::month{period.month}, std::chrono::day{1}};
    const auto from = date_arg(args, "from", period_start);
    const auto to = date_arg(args, "to", period.deadline());

    auto statements = std::make_shared<JsonStatementSource>(
        JsonStatementSource::from_file(args.require("statement")));
    auto audit = std::make_shared<AuditTrail>(ctx.config.audit);
    PaymentReconciler reconciler(statements, ReconcilerConfig{}, audit);

    const auto rec = reconciler.start({batch}, from, to, actor);
    audit->flush();

    for (const auto& line : rec.lines) {
        std::cout << std::format("{:<12} {:<30} {:>12} {:>12} {}\n", line.employee_ref, line.employee_name,
            money::format_amount(money::round_to_subunits(line.wps_amount)),
            money::format_amount(money::round_to_subunits(line.bank_amount)),
            match_state_to_string(line.state));
    }
    const auto summary = rec.summary();
    std::cout << std::format("{}: {} ({}/{} matched, {:.1f}%, difference {} AED)\n", rec.reference,
        reconciliation_state_to_string(rec.state), summary.matched_employees, summary.total_employees,
        summary.match_percentage(), money::format_amount(summary.difference_subunits()));
    return rec.state == ReconciliationState::RECONCILED ? kExitOk : kExitInvalid;
}

int exit_code_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::FORMAT_ERROR:
        case ErrorCategory::VALIDATION_BLOCKED:
            return kExitInvalid;
        case ErrorCategory::CONNECTION_NOT_ACTIVE:
        case ErrorCategory::TRANSMISSION_ERROR:
        case ErrorCategory::RETRY_EXHAUSTED:
        case ErrorCategory::STATE_ERROR:
            return kExitSubmission;
        default:
            return kExitUsage;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const CliArgs args(argc, argv);
        const auto& command = args.command();

        if (command == "assemble") return cmd_assemble(args);
        if (command == "validate") return cmd_validate(args);
        if (command == "encode") return cmd_encode(args);
        if (command == "decode") return cmd_decode(args);
        if (command == "submit") return cmd_submit(args);
        if (command == "reconcile") return cmd_reconcile(args);

        std::cerr << kUsage;
        return kExitUsage;
    } catch (const ValidationBlocked& e) {
        std::cerr << format_validation_summary(e.result());
        return kExitInvalid;
    } catch (const WpsError& e) {
        utils::log::error(std::format("{}: {}", error_category_to_string(e.category()), e.what()));
        return exit_code_for(e.category());
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitUsage;
    }
}
