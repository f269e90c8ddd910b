/**
 * @file client_main.cpp
 * @brief tco_client: command-line test client for the scheduler daemon.
 *
 * Exit status: 0 on success, 1 on usage or transport failure, 2 when the
 * scheduler answered with an infeasible placement or an error.
 */

#include "core/types.hpp"
#include "rpc/rpc_client.hpp"
#include "rpc/messages.hpp"

#include <charconv>
#include <ctime>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace tco_scheduler;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_REMOTE = 2;

const char* const RULE = "----------------------------------------";

void print_usage() {
    std::cout
        << "Usage: tco_client [--scheduler host:port] <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  submit-job     --job-id <id> [--cpu N] [--memory GB] [--gpu N] [--budget USD]\n"
        << "                 [--latency MS] [--duration HOURS] [--data GB] [--location ZONE]\n"
        << "                 [--image IMAGE] [-- command args...]\n"
        << "  get-status     <job-id>\n"
        << "  get-cost       <job-id>\n"
        << "  cluster-status\n"
        << "  list-nodes\n"
        << "  register-node  --node-id <id> --cpu N --memory GB [--gpu N] [--price USD/h]\n"
        << "                 [--transfer-price USD/GB] [--idle-cost USD/h] [--location ZONE]\n"
        << "                 [--base-latency MS] [--on-premise]\n"
        << "  heartbeat      <node-id> [--free-cpu N --free-memory GB [--free-gpu N]]\n"
        << "\n"
        << "The scheduler address defaults to 127.0.0.1:50051.\n";
}

/**
 * @brief `--key value` options, bare flags and positionals of one subcommand.
 */
class Options {
public:
    Options(int argc, char* argv[], int first, const std::set<std::string>& flags) {
        for (int i = first; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--") {
                for (++i; i < argc; ++i) trailing_.emplace_back(argv[i]);
                break;
            }
            if (arg.rfind("--", 0) == 0) {
                auto key = arg.substr(2);
                if (flags.count(key) > 0) {
                    values_[key] = "true";
                } else if (i + 1 < argc) {
                    values_[key] = argv[++i];
                } else {
                    error_ = "missing value for " + arg;
                }
            } else {
                positionals_.push_back(arg);
            }
        }
    }

    [[nodiscard]] const std::string& error() const noexcept { return error_; }
    [[nodiscard]] bool has(const std::string& key) const { return values_.count(key) > 0; }
    [[nodiscard]] const std::vector<std::string>& positionals() const noexcept { return positionals_; }
    [[nodiscard]] const std::vector<std::string>& trailing() const noexcept { return trailing_; }

    [[nodiscard]] std::string str(const std::string& key, std::string fallback = {}) const {
        auto it = values_.find(key);
        return it == values_.end() ? fallback : it->second;
    }

    template <typename Int>
    Int integer(const std::string& key, Int fallback) {
        auto it = values_.find(key);
        if (it == values_.end()) return fallback;
        Int out{};
        const auto& text = it->second;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            error_ = "--" + key + " expects an integer, got '" + text + "'";
            return fallback;
        }
        return out;
    }

    double number(const std::string& key, double fallback) {
        auto it = values_.find(key);
        if (it == values_.end()) return fallback;
        const auto& text = it->second;
        char* end = nullptr;
        double out = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size()) {
            error_ = "--" + key + " expects a number, got '" + text + "'";
            return fallback;
        }
        return out;
    }

private:
    std::map<std::string, std::string> values_;
    std::vector<std::string> positionals_;
    std::vector<std::string> trailing_;
    std::string error_;
};

int usage_error(const std::string& message) {
    std::cerr << "error: " << message << "\n\n";
    print_usage();
    return EXIT_USAGE;
}

/// Map a failed call to an exit status: transport problems are local.
int report_error(const Error& error) {
    std::cerr << "error [" << to_string(error.code) << "]: " << error.message << "\n";
    return error.is(ErrorCode::Transport) ? EXIT_USAGE : EXIT_REMOTE;
}

std::string format_time(int64_t epoch_ms) {
    if (epoch_ms == 0) return "-";
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "Z";
    return oss.str();
}

void print_cost(const CostBreakdown& cost) {
    std::cout << std::fixed << std::setprecision(6)
              << "  C_comp (Compute):     $" << cost.compute_usd << "\n"
              << "  C_data (Transfer):    $" << cost.data_transfer_usd << "\n"
              << "  C_idle (Opportunity): $" << cost.idle_opportunity_usd << "\n"
              << "  C_total (TCO):        $" << cost.total_usd << "\n";
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

int cmd_submit(SchedulerClient& client, Options& opts) {
    SubmitJobRequest req;
    req.job_id = opts.str("job-id");
    req.cpu_cores = opts.integer<uint32_t>("cpu", 1);
    req.memory_gb = opts.number("memory", 1.0);
    req.gpu_count = opts.integer<uint32_t>("gpu", 0);
    req.budget_usd = opts.number("budget", 0.0);
    req.max_latency_ms = opts.integer<uint64_t>("latency", 1000);
    req.estimated_duration_hours = opts.number("duration", 1.0);
    req.estimated_data_gb = opts.number("data", 0.0);
    req.preferred_location = opts.str("location");
    req.image = opts.str("image", "alpine:latest");
    req.command = opts.trailing();
    if (!opts.error().empty()) return usage_error(opts.error());
    if (req.job_id.empty()) return usage_error("submit-job requires --job-id");

    auto resp = client.submit_job(req);
    if (!resp) return report_error(resp.error());

    if (!resp->placed) {
        std::cout << "\nJob Infeasible\n" << RULE << "\n"
                  << "Job ID:        " << resp->job_id << "\n"
                  << "Reason:        " << resp->infeasible_reason << "\n"
                  << "Message:       " << resp->message << "\n"
                  << RULE << "\n\n";
        return EXIT_REMOTE;
    }

    std::cout << "\nJob Submitted Successfully\n" << RULE << "\n"
              << "Job ID:        " << resp->job_id << "\n"
              << "Assigned Node: " << resp->assigned_node << "\n"
              << "\nCost Estimate (Formula 4.1):\n";
    print_cost(resp->cost);
    std::cout << "  Estimated Latency:    " << resp->estimated_latency_ms << "ms\n"
              << "\nMessage: " << resp->message << "\n"
              << RULE << "\n\n";
    return EXIT_OK;
}

int cmd_get_status(SchedulerClient& client, Options& opts) {
    if (opts.positionals().size() != 1) return usage_error("get-status takes one <job-id>");

    auto resp = client.get_job_status(opts.positionals()[0]);
    if (!resp) return report_error(resp.error());

    std::cout << "\nJob Status\n" << RULE << "\n"
              << "Job ID:        " << resp->job_id << "\n"
              << "Status:        " << resp->status << "\n"
              << "Assigned Node: " << (resp->assigned_node.empty() ? "-" : resp->assigned_node)
              << "\n"
              << "Submitted:     " << format_time(resp->submitted_at_ms) << "\n"
              << "Started:       " << format_time(resp->started_at_ms) << "\n"
              << "Ended:         " << format_time(resp->ended_at_ms) << "\n"
              << "Requeues:      " << resp->requeue_count << "\n";
    if (!resp->failure_reason.empty()) {
        std::cout << "Failure:       " << resp->failure_reason;
        if (!resp->failure_detail.empty()) std::cout << " (" << resp->failure_detail << ")";
        std::cout << "\n";
    }
    std::cout << RULE << "\n\n";
    return EXIT_OK;
}

int cmd_get_cost(SchedulerClient& client, Options& opts) {
    if (opts.positionals().size() != 1) return usage_error("get-cost takes one <job-id>");

    auto resp = client.get_job_cost(opts.positionals()[0]);
    if (!resp) return report_error(resp.error());

    std::cout << "\nJob Cost (Formula 4.1)\n" << RULE << "\n"
              << "Job ID:        " << resp->job_id << "\n";
    print_cost(resp->cost);
    std::cout << RULE << "\n\n";
    return EXIT_OK;
}

int cmd_cluster_status(SchedulerClient& client) {
    auto resp = client.cluster_status();
    if (!resp) return report_error(resp.error());

    std::cout << "\nCluster Status\n" << RULE << "\n"
              << "Cluster:       " << resp->cluster_id << "\n"
              << "Total Nodes:   " << resp->total_nodes << "\n"
              << "Active Nodes:  " << resp->active_nodes << "\n"
              << "Total Jobs:    " << resp->total_jobs << "\n"
              << "Running Jobs:  " << resp->running_jobs << "\n"
              << RULE << "\n\n";
    return EXIT_OK;
}

int cmd_list_nodes(SchedulerClient& client) {
    auto resp = client.list_nodes();
    if (!resp) return report_error(resp.error());

    std::cout << "\nRegistered Nodes (" << resp->nodes.size() << ")\n" << RULE << "\n";
    for (const auto& node : resp->nodes) {
        std::cout << std::fixed << std::setprecision(1)
                  << "\n  Node: " << node.node_id << "\n"
                  << "    Location:   " << node.location
                  << (node.on_premise ? " (on-premise)" : "") << "\n"
                  << "    CPU:        " << node.free_cpu_cores << "/" << node.cpu_cores
                  << " free\n"
                  << "    Memory:     " << node.free_memory_gb << "/" << node.memory_gb
                  << " GB free\n"
                  << "    GPU:        " << node.gpu_count << "\n"
                  << std::setprecision(4)
                  << "    Price:      $" << node.cost_per_hour_usd << "/h\n"
                  << "    Status:     " << node.status << "\n";
    }
    std::cout << RULE << "\n\n";
    return EXIT_OK;
}

int cmd_register_node(SchedulerClient& client, Options& opts) {
    RegisterNodeRequest req;
    req.node_id = opts.str("node-id");
    req.location = opts.str("location", "default");
    req.cpu_cores = opts.integer<uint32_t>("cpu", 0);
    req.memory_gb = opts.number("memory", 0.0);
    req.gpu_count = opts.integer<uint32_t>("gpu", 0);
    req.cost_per_hour_usd = opts.number("price", 0.0);
    req.transfer_price_per_gb = opts.number("transfer-price", 0.0);
    req.opportunity_cost_per_hour = opts.number("idle-cost", 0.0);
    req.on_premise = opts.has("on-premise");
    req.base_latency_ms = opts.integer<uint32_t>("base-latency", 0);
    if (!opts.error().empty()) return usage_error(opts.error());
    if (req.node_id.empty()) return usage_error("register-node requires --node-id");

    auto resp = client.register_node(req);
    if (!resp) return report_error(resp.error());

    std::cout << "Node registered: " << resp->node_id << "\n";
    return EXIT_OK;
}

int cmd_heartbeat(SchedulerClient& client, Options& opts) {
    if (opts.positionals().size() != 1) return usage_error("heartbeat takes one <node-id>");

    HeartbeatRequest req;
    req.node_id = opts.positionals()[0];
    if (opts.has("free-cpu") || opts.has("free-memory")) {
        req.has_free_capacity = true;
        req.free_cpu_cores = opts.integer<uint32_t>("free-cpu", 0);
        req.free_memory_gb = opts.number("free-memory", 0.0);
        req.free_gpu_count = opts.integer<uint32_t>("free-gpu", 0);
    }
    if (!opts.error().empty()) return usage_error(opts.error());

    auto resp = client.heartbeat(req);
    if (!resp) return report_error(resp.error());

    std::cout << "Heartbeat accepted: " << req.node_id << "\n";
    return EXIT_OK;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string address = "127.0.0.1:50051";

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--scheduler" || arg == "-s") && i + 1 < argc) {
            address = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return EXIT_OK;
        } else {
            break;
        }
    }
    if (i >= argc) return usage_error("missing command");

    auto endpoint = parse_endpoint(address);
    if (!endpoint) return usage_error(endpoint.error().message);

    std::string command = argv[i];
    SchedulerClient client(*endpoint);
    Options opts(argc, argv, i + 1, {"on-premise"});
    if (!opts.error().empty()) return usage_error(opts.error());

    if (command == "submit-job") return cmd_submit(client, opts);
    if (command == "get-status") return cmd_get_status(client, opts);
    if (command == "get-cost") return cmd_get_cost(client, opts);
    if (command == "cluster-status") return cmd_cluster_status(client);
    if (command == "list-nodes") return cmd_list_nodes(client);
    if (command == "register-node") return cmd_register_node(client, opts);
    if (command == "heartbeat") return cmd_heartbeat(client, opts);

    return usage_error("unknown command '" + command + "'");
}
