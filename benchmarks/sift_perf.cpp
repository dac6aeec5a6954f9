#include "sift.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

namespace bench
{

using Clock = std::chrono::high_resolution_clock;

struct Stats
{
    double min_ns;
    double max_ns;
    double mean_ns;
    double median_ns;
    double stddev_ns;
};

struct BenchConfig
{
    std::size_t warmup_runs = 1;
    std::size_t measure_runs = 5;
    std::size_t users = 10000;
    double scale = 1.0;
    std::string filter;
    bool list_only = false;
    bool csv = false;
};

struct BenchCase
{
    std::string name;
    std::size_t inner_iterations;
    std::size_t bytes_per_iteration;
    std::function<void()> body;
};

struct BenchResult
{
    std::string name;
    Stats stats;
    std::size_t iterations;
    double throughput_mb_s;
};

static volatile std::uint64_t g_sink = 0;

template <class T>
inline void DoNotOptimize(const T& value)
{
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : "g"(value) : "memory");
#else
    std::atomic_signal_fence(std::memory_order_acq_rel);
#endif
}

inline void Ensure(bool condition, const std::string& message)
{
    if (!condition) {
        std::fprintf(stderr, "error: %s\n", message.c_str());
        std::exit(1);
    }
}

inline Stats
ComputeStats(std::vector<double> samples)
{
    Ensure(!samples.empty(), "ComputeStats called with empty samples");
    Stats stats;
    std::sort(samples.begin(), samples.end());
    stats.min_ns = samples.front();
    stats.max_ns = samples.back();
    stats.mean_ns = std::accumulate(samples.begin(), samples.end(), 0.0) /
                    samples.size();
    double variance = 0.0;
    for (double sample : samples)
        variance += (sample - stats.mean_ns) * (sample - stats.mean_ns);
    stats.stddev_ns = std::sqrt(variance / samples.size());
    std::size_t mid = samples.size() / 2;
    if (samples.size() % 2 == 0)
        stats.median_ns = (samples[mid - 1] + samples[mid]) * 0.5;
    else
        stats.median_ns = samples[mid];
    return stats;
}

inline std::size_t
ClampIterations(std::size_t base, double scale)
{
    double scaled = base * scale;
    if (scaled < 1.0)
        return 1;
    return static_cast<std::size_t>(scaled);
}

class Runner
{
  public:
    explicit Runner(const BenchConfig& cfg) : config_(cfg)
    {
    }

    void run(const BenchCase& bench_case)
    {
        if (!config_.filter.empty() &&
            bench_case.name.find(config_.filter) == std::string::npos)
            return;
        if (config_.list_only) {
            std::printf("%s\n", bench_case.name.c_str());
            return;
        }

        const std::size_t inner =
          ClampIterations(bench_case.inner_iterations, config_.scale);
        for (std::size_t w = 0; w < config_.warmup_runs; ++w)
            for (std::size_t i = 0; i < inner; ++i)
                bench_case.body();

        std::vector<double> samples;
        samples.reserve(config_.measure_runs);
        for (std::size_t run = 0; run < config_.measure_runs; ++run) {
            Clock::time_point start = Clock::now();
            for (std::size_t i = 0; i < inner; ++i)
                bench_case.body();
            Clock::time_point end = Clock::now();
            samples.push_back(
              static_cast<double>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(end -
                                                                     start)
                  .count()) /
              inner);
        }

        BenchResult result;
        result.name = bench_case.name;
        result.stats = ComputeStats(samples);
        result.iterations = inner;
        result.throughput_mb_s = 0.0;
        if (bench_case.bytes_per_iteration > 0 && result.stats.median_ns > 0.0)
            result.throughput_mb_s =
              (bench_case.bytes_per_iteration * 1e3) / result.stats.median_ns;
        results_.push_back(result);

        if (!config_.csv) {
            std::printf("%-32s %12.2f ns/op  (median %.2f | min %.2f | max "
                        "%.2f | stddev %.2f)  inner=%-6zu",
                        result.name.c_str(),
                        result.stats.mean_ns,
                        result.stats.median_ns,
                        result.stats.min_ns,
                        result.stats.max_ns,
                        result.stats.stddev_ns,
                        inner);
            if (result.throughput_mb_s > 0.0)
                std::printf("  throughput=%.2f MB/s", result.throughput_mb_s);
            std::printf("\n");
        }
    }

    const std::vector<BenchResult>& getResults() const
    {
        return results_;
    }

  private:
    BenchConfig config_;
    std::vector<BenchResult> results_;
};

inline void
PrintCSVReport(const std::vector<BenchResult>& results)
{
    std::printf("benchmark,mean_ns,median_ns,min_ns,max_ns,stddev_ns,"
                "iterations,throughput_mb_s\n");
    for (const auto& r : results)
        std::printf("%s,%.2f,%.2f,%.2f,%.2f,%.2f,%zu,%.2f\n",
                    r.name.c_str(),
                    r.stats.mean_ns,
                    r.stats.median_ns,
                    r.stats.min_ns,
                    r.stats.max_ns,
                    r.stats.stddev_ns,
                    r.iterations,
                    r.throughput_mb_s);
}

inline bool
HasPrefix(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

inline BenchConfig
ParseArgs(int argc, char** argv)
{
    BenchConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            std::printf("sift_perf options:\n");
            std::printf("  --warmup N       Number of warmup runs (default 1)\n");
            std::printf("  --runs N         Number of measured runs (default 5)\n");
            std::printf("  --users N        Users in the generated document (default 10000)\n");
            std::printf("  --scale X        Scale inner iteration counts by X\n");
            std::printf("  --filter STR     Only run benchmarks containing STR\n");
            std::printf("  --list           List benchmark names\n");
            std::printf("  --csv            Print a CSV report instead of text\n");
            std::exit(0);
        } else if (arg == "--warmup") {
            Ensure(i + 1 < argc, "--warmup requires an argument");
            config.warmup_runs = std::strtoul(argv[++i], NULL, 10);
        } else if (arg == "--runs") {
            Ensure(i + 1 < argc, "--runs requires an argument");
            config.measure_runs = std::strtoul(argv[++i], NULL, 10);
        } else if (arg == "--users") {
            Ensure(i + 1 < argc, "--users requires an argument");
            config.users = std::strtoul(argv[++i], NULL, 10);
        } else if (arg == "--scale") {
            Ensure(i + 1 < argc, "--scale requires an argument");
            config.scale = std::atof(argv[++i]);
        } else if (arg == "--filter") {
            Ensure(i + 1 < argc, "--filter requires an argument");
            config.filter = argv[++i];
        } else if (HasPrefix(arg, "--filter=")) {
            config.filter = arg.substr(9);
        } else if (arg == "--list") {
            config.list_only = true;
        } else if (arg == "--csv") {
            config.csv = true;
        } else {
            Ensure(false, std::string("unknown argument: ") + arg);
        }
    }
    if (config.measure_runs == 0)
        config.measure_runs = 1;
    if (config.users == 0)
        config.users = 1;
    return config;
}

// {"users":[{"id":0,"name":"User 0","email":"user0@example.com",
// "profile":{"bio":"...","avatar":"...","settings":{...}}}, ...]}
inline std::string
BuildUsers(std::size_t count)
{
    std::string bio;
    for (int i = 0; i < 10; ++i)
        bio += "Lorem ipsum dolor sit amet. ";
    std::string json = "{\"users\":[";
    for (std::size_t i = 0; i < count; ++i) {
        std::string n = std::to_string(i);
        if (i)
            json += ',';
        json += "{\"id\":" + n + ",\"name\":\"User " + n +
                "\",\"email\":\"user" + n + "@example.com\",\"profile\":{" +
                "\"bio\":\"" + bio + "\",\"avatar\":\"https:\\/\\/example.com" +
                "\\/avatars\\/" + n + ".jpg\",\"settings\":{\"theme\":\"dark\"," +
                "\"notifications\":true,\"language\":\"en\"}}}";
    }
    json += "]}";
    return json;
}

} // namespace bench

static const char kTypes[] =
  R"({"string": "hello", "int": 42, "float": 3.14159, "bool": true, )"
  R"("null": null, "array": [1, 2, 3], "object": {"nested": "value"}})";

int
main(int argc, char** argv)
{
    using namespace bench;

    BenchConfig config = ParseArgs(argc, argv);

    const std::string users = BuildUsers(config.users);
    const std::size_t target = config.users / 2;
    const std::string email_pointer =
      "/users/" + std::to_string(target) + "/email";
    const std::string profile_pointer =
      "/users/" + std::to_string(target) + "/profile";
    const std::size_t small_bytes = sizeof(kTypes) - 1;

    Ensure(sift::isValid(users), "generated document is not valid JSON");
    Ensure(sift::getByPointer(users, email_pointer).getString() ==
             "user" + std::to_string(target) + "@example.com",
           "lazy extraction returned the wrong user");

    std::vector<BenchCase> cases;

    cases.push_back({ "decode.small", 20000, small_bytes, [&]() {
                         sift::Value v = sift::decode(kTypes);
                         g_sink += v.size();
                     } });

    cases.push_back({ "query.small_string", 20000, small_bytes, [&]() {
                         std::string s =
                           sift::query(kTypes).get("string").getString();
                         g_sink += s.size();
                     } });

    cases.push_back({ "decode.users+access", 2, users.size(), [&]() {
                         sift::Value v = sift::decode(users);
                         const sift::Value& user =
                           v["users"].getArray()[target];
                         g_sink += user.find("email")->getString().size();
                     } });

    cases.push_back({ "get_by_pointer.users_email", 20, users.size(), [&]() {
                         sift::Value v = sift::getByPointer(users, email_pointer);
                         g_sink += v.getString().size();
                     } });

    cases.push_back({ "query.chained_email", 20, users.size(), [&]() {
                         std::string s = sift::query(users)
                                           .get("users")
                                           .index(target)
                                           .get("email")
                                           .getString();
                         g_sink += s.size();
                     } });

    cases.push_back({ "query.profile_value", 20, users.size(), [&]() {
                         sift::Value v =
                           sift::query(users).pointer(profile_pointer).value();
                         g_sink += v.size();
                     } });

    cases.push_back({ "query.profile_raw", 20, users.size(), [&]() {
                         std::string s =
                           sift::query(users).pointer(profile_pointer).raw();
                         DoNotOptimize(s);
                         g_sink += s.size();
                     } });

    cases.push_back({ "is_valid.users", 4, users.size(), [&]() {
                         g_sink += sift::isValid(users);
                     } });

    cases.push_back({ "get_by_pointer.missing", 20, users.size(), [&]() {
                         try {
                             sift::getByPointer(users, "/missing");
                         } catch (const sift::Error& e) {
                             g_sink += e.kind();
                         }
                     } });

    if (!config.list_only && !config.csv)
        std::printf("sift_perf: users=%zu (%.2f MB) warmup=%zu runs=%zu "
                    "scale=%.2f\n",
                    config.users,
                    users.size() / 1048576.0,
                    config.warmup_runs,
                    config.measure_runs,
                    config.scale);

    Runner runner(config);
    for (std::size_t i = 0; i < cases.size(); ++i)
        runner.run(cases[i]);

    if (config.csv)
        PrintCSVReport(runner.getResults());
    else if (!config.list_only)
        std::printf("sink=%llu\n", static_cast<unsigned long long>(g_sink));

    return 0;
}
