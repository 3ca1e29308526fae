#include <benchmark/benchmark.h>
#include "herd/logging/Log.h"
#include "herd/nav/Navigation.h"
#include "herd/nav/NavConfig.h"
#include "herd/nav/NavigationContext.h"
#include "herd/nav/PathResolver.h"
#include <cstdlib>
#include <random>
#include <filesystem>
#include <fstream>
#include <string>

using namespace herd::nav;

// Simple loader for Moving AI .map (ASCII)
// https://www.movingai.com/benchmarks/  (point HERD_BENCH_MAP at a .map file)
static bool load_movingai_map(const std::filesystem::path& file, CostGrid& out) {
    std::ifstream f(file);
    if (!f) return false;
    std::string line;
    int w=0,h=0;
    while (std::getline(f,line)) {
        if (line.rfind("type",0)==0) continue;
        if (line.rfind("height",0)==0) { h = std::atoi(line.c_str() + 7); continue; }
        if (line.rfind("width",0)==0)  { w = std::atoi(line.c_str() + 6); continue; }
        if (line=="map") break;
    }
    if (w<=0 || h<=0) return false;
    out = CostGrid(w,h);
    for (int y=0;y<h;++y) {
        if (!std::getline(f,line)) return false;
        for (int x=0;x<w && x<static_cast<int>(line.size());++x) {
            const char c = line[static_cast<size_t>(x)];
            // '.' and 'G' are ground, 'S' swamp and 'W' water cost extra; '@','T' etc are blocked
            if (c=='S' || c=='W') out.SetCost(x,y, 4);
            else if (c!='.' && c!='G') out.SetObstacle(x,y);
        }
    }
    return true;
}

static CostGrid make_random(int w,int h, double blocked, uint32_t seed=1337) {
    CostGrid m(w,h);
    std::mt19937 rng(seed);
    std::bernoulli_distribution is_blocked(blocked);
    for (int y=0;y<h;++y) for (int x=0;x<w;++x) if (is_blocked(rng)) m.SetObstacle(x,y);
    m.ClearObstacle(1,1); m.ClearObstacle(w-2,h-2);
    return m;
}

// HERD_NAV_CONFIG may point at a navigation.json to benchmark other settings.
static NavConfig bench_config() {
    NavConfig cfg;
    cfg.logLevel = "warn";
    if (const char* file = std::getenv("HERD_NAV_CONFIG"))
        if (!LoadNavConfig(cfg, file))
            herd::logsys::get()->warn("HERD_NAV_CONFIG={} not loaded, using defaults", file);
    return cfg; // NavigationContext applies logLevel
}

static void bench_build_sync_random(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const CostGrid m = make_random(w, w, 0.10);
    NavigationContext ctx(bench_config());
    for (auto _ : st) {
        const bool ok = ctx.BuildGraphSync(m);
        benchmark::DoNotOptimize(ok);
    }
    st.counters["portals"] = static_cast<double>(ctx.Graph() ? ctx.Graph()->NodeCount() : 0);
}
BENCHMARK(bench_build_sync_random)->Arg(100)->Arg(200)->Arg(300)->Unit(benchmark::kMillisecond);

static void bench_build_movingai(benchmark::State& st) {
    const char* file = std::getenv("HERD_BENCH_MAP");
    CostGrid m;
    if (!file || !load_movingai_map(file, m)) {
        st.SkipWithError("set HERD_BENCH_MAP to a Moving AI .map file");
        return;
    }
    NavigationContext ctx(bench_config());
    for (auto _ : st) {
        const bool ok = ctx.BuildGraphSync(m);
        benchmark::DoNotOptimize(ok);
    }
}
BENCHMARK(bench_build_movingai)->Unit(benchmark::kMillisecond);

static void bench_resolve_path(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const CostGrid m = make_random(w, w, 0.10);
    NavigationContext ctx(bench_config());
    if (!ctx.BuildGraphSync(m)) {
        st.SkipWithError("navigation build failed");
        return;
    }
    const FixedVec2 start = m.GridToWorld({1,1});
    const FixedVec2 goal = m.GridToWorld({w-2,w-2});
    for (auto _ : st) {
        auto path = ResolvePath(ctx, m, start, goal);
        benchmark::DoNotOptimize(path.has_value());
    }
}
BENCHMARK(bench_resolve_path)->Arg(100)->Arg(200);

static void bench_next_target(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const CostGrid m = make_random(w, w, 0.10);
    NavigationContext ctx(bench_config());
    if (!ctx.BuildGraphSync(m)) {
        st.SkipWithError("navigation build failed");
        return;
    }
    const FixedVec2 start = m.GridToWorld({1,1});
    auto path = ResolvePath(ctx, m, start, m.GridToWorld({w-2,w-2}));
    if (!path) {
        st.SkipWithError("no path on this seed");
        return;
    }
    for (auto _ : st) {
        auto t = NextNavigationTarget(ctx, m, start, *path, herd::math::Fixed::FromFraction(1, 4));
        benchmark::DoNotOptimize(t.position);
    }
}
BENCHMARK(bench_next_target)->Arg(100)->Arg(200);

BENCHMARK_MAIN();
