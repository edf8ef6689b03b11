#include "semsearch/core/platform_utils.hpp"
#include "semsearch.grpc.pb.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

namespace {
struct Args {
    std::string target{"127.0.0.1:50051"};
    std::size_t concurrency{8};
    std::size_t requests{100};
    std::size_t batch_size{1};
    std::int32_t k{10};
};

constexpr std::size_t kWarmupCalls = 10;

const std::vector<std::string> kQueries = {
    "Asia shares drift lower as investors factor in Fed rate hike.",
    "Oil prices climb after supply disruption in the Gulf of Mexico",
    "Tech giant unveils new smartphone with longer battery life",
    "Local team wins championship after dramatic overtime finish",
    "Scientists report progress on a vaccine for seasonal influenza",
    "Central bank holds interest rates steady amid inflation worries",
    "Startup raises funding to build electric delivery vehicles",
    "Storm forces evacuation of coastal towns as flooding spreads",
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "Usage: semsearch_client [--target=127.0.0.1:50051] [--concurrency=8]\n"
              << "  [--requests=100] [--batch_size=1] [--k=10]\n";
}

/** \brief Nearest-rank percentile of sorted samples. */
static double percentile(const std::vector<std::uint64_t>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    const auto rank = static_cast<std::size_t>(std::ceil(p / 100.0 * static_cast<double>(sorted.size())));
    return static_cast<double>(sorted[std::clamp<std::size_t>(rank, 1, sorted.size()) - 1]);
}

static void report(std::string_view name, std::vector<std::uint64_t> ns) {
    if (ns.empty()) return;
    std::sort(ns.begin(), ns.end());
    const double mean = std::accumulate(ns.begin(), ns.end(), 0.0) / static_cast<double>(ns.size());
    constexpr double kMs = 1e6;
    std::cout << std::fixed << std::setprecision(3)
              << std::setw(6) << name << " latency : mean=" << mean / kMs << "ms"
              << " max=" << static_cast<double>(ns.back()) / kMs << "ms"
              << " p95=" << percentile(ns, 95.0) / kMs << "ms"
              << " p99=" << percentile(ns, 99.0) / kMs << "ms"
              << " p99.9=" << percentile(ns, 99.9) / kMs << "ms\n";
}
} // namespace

int main(int argc, char** argv) {
    using semsearch::core::parse_unsigned;
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        std::optional<unsigned long long> n;
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--target=")) args.target = *v;
        else if (auto v = eat(a, "--concurrency=")) { n = parse_unsigned(*v); if (n && *n > 0) args.concurrency = *n; else n.reset(); }
        else if (auto v = eat(a, "--requests=")) { n = parse_unsigned(*v); if (n) args.requests = *n; }
        else if (auto v = eat(a, "--batch_size=")) { n = parse_unsigned(*v); if (n && *n > 0) args.batch_size = *n; else n.reset(); }
        else if (auto v = eat(a, "--k=")) { n = parse_unsigned(*v); if (n && *n > 0 && *n < 1u << 20) args.k = static_cast<std::int32_t>(*n); else n.reset(); }
        else { std::cerr << "error: unknown argument " << a << "\n"; print_usage(); return 1; }
        if (a.rfind("--target=", 0) != 0 && !n) {
            std::cerr << "error: invalid value in " << a << "\n";
            return 1;
        }
    }

    auto channel = grpc::CreateChannel(args.target, grpc::InsecureChannelCredentials());
    std::mutex mu;
    std::vector<std::uint64_t> total_ns;
    std::vector<std::uint64_t> model_ns;
    std::vector<std::uint64_t> search_ns;
    std::atomic<std::size_t> failures{0};
    std::string first_failure;

    auto user = [&](std::size_t uid) {
        auto stub = semsearch::Inference::NewStub(channel);
        std::vector<std::uint64_t> t_local, m_local, s_local;
        for (std::size_t i = 0; i < kWarmupCalls + args.requests; ++i) {
            semsearch::PredictRequest request;
            request.set_k(args.k);
            for (std::size_t b = 0; b < args.batch_size; ++b) {
                request.add_features()->set_query(kQueries[(uid + i + b) % kQueries.size()]);
            }
            semsearch::PredictResponse response;
            grpc::ClientContext ctx;
            ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(30));
            const auto start = std::chrono::steady_clock::now();
            const grpc::Status status = stub->Predict(&ctx, request, &response);
            const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (!status.ok()) {
                if (failures.fetch_add(1) == 0) {
                    std::lock_guard<std::mutex> g(mu);
                    first_failure = status.error_message();
                }
                continue;
            }
            if (i < kWarmupCalls) continue;
            t_local.push_back(static_cast<std::uint64_t>(elapsed));
            m_local.push_back(response.model_latency());
            s_local.push_back(response.search_latency());
        }
        std::lock_guard<std::mutex> g(mu);
        total_ns.insert(total_ns.end(), t_local.begin(), t_local.end());
        model_ns.insert(model_ns.end(), m_local.begin(), m_local.end());
        search_ns.insert(search_ns.end(), s_local.begin(), s_local.end());
    };

    const auto t0 = std::chrono::steady_clock::now();
    std::vector<std::thread> users;
    users.reserve(args.concurrency);
    for (std::size_t u = 0; u < args.concurrency; ++u) {
        users.emplace_back(user, u);
    }
    for (auto& t : users) t.join();
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    std::cout << "users=" << args.concurrency << " requests/user=" << args.requests
              << " batch_size=" << args.batch_size << " k=" << args.k
              << " ok=" << total_ns.size() << " failed=" << failures.load()
              << " elapsed=" << std::setprecision(3) << secs << "s\n";
    report("total", total_ns);
    report("model", model_ns);
    report("search", search_ns);

    if (failures.load() > 0) {
        std::cerr << "error: " << failures.load() << " calls failed; first: " << first_failure << "\n";
        return 1;
    }
    return 0;
}
